#include "headers.hpp"
#include "../../util/logger.hpp"

namespace apisrv::http{

    void headers::add_header(std::string key, std::string value){
        if(key.empty()) return;
        headers_.emplace_back(std::move(key), std::move(value));
    }

    void headers::set_header(std::string key, std::string value){
        for(auto & header : headers_)
        {
            if(is_header(header.first, key)){
                header.second = std::move(value);
                return;
            }
        }
        add_header(std::move(key), std::move(value));
    }

    bool headers::has_header(std::string_view key) const{
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return true;
            }
        }
        return false;
    }

    const std::string& headers::get_header(std::string_view key) const
    {
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                return header.second;
            }
        }
        static const std::string empty;
        return empty;
    }

    std::vector<std::string> headers::get_headers_with_key(std::string_view key) const{
        std::vector<std::string> values;
        for(const auto & header : headers_)
        {
            if(is_header(header.first, key)){
                values.push_back(header.second);
            }
        }
        return values;
    }

    bool headers::remove_header(std::string_view key)
    {
        for(auto it=headers_.begin(); it!=headers_.end(); ++it){
            if(is_header(it->first, key)){
                headers_.erase(it);
                return true;
            }
        }
        return false;
    }

    const std::vector<headers::http_header>& headers::get_headers() const{
        return headers_;
    }

    const std::string& headers::get_content_type() const
    {
        return get_header(header::content_type);
    }

    const std::string& headers::get_authorization() const
    {
        return get_header(header::authorization);
    }

    bool headers::empty_headers() const{
        return headers_.empty();
    }

    void headers::log(const char* scope) const{
        LOG_DEBUG("[{}] Headers:", scope);
        for(const auto& t: headers_){
            LOG_DEBUG("  {}: {}", t.first, t.second);
        }
    }

}
