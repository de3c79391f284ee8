#include "request_context.hpp"
#include "../../util/logger.hpp"

#include <algorithm>

namespace apisrv::http{

    namespace source_labels{
        const std::string body = "request body";
        const std::string query = "query string";
        const std::string path = "path template";
    }

    const std::string& get_param_source_label(param_source source){
        switch(source){
            case param_source::body:
                return source_labels::body;
            case param_source::query:
                return source_labels::query;
            default:
                return source_labels::path;
        }
    }

    request_context::request_context(std::shared_ptr<http_request> request) :
        request_{std::move(request)}
    {

    }

    method request_context::get_method() const{
        return request_->get_method();
    }

    const std::string& request_context::get_method_name() const{
        return request_->get_method_name();
    }

    const std::string& request_context::get_uri() const{
        return request_->get_uri();
    }

    std::string_view request_context::get_path() const{
        return request_->get_path();
    }

    std::string_view request_context::get_query() const{
        return request_->get_query();
    }

    const std::string& request_context::header(std::string_view key) const{
        return request_->get_header(key);
    }

    std::string request_context::operator[](const std::string& key) const{
        if(!params.is_object()) return {};
        auto it = params.find(key);
        if(it == params.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    bool request_context::has(const std::string& key) const{
        return params.is_object() && params.contains(key);
    }

    void request_context::assign_params(const nlohmann::json& source, param_source type){
        if(!source.is_object()) return;
        if(!params.is_object()) params = nlohmann::json::object();

        for(auto it = source.begin(); it != source.end(); ++it){
            const std::string& key = it.key();
            if(params.contains(key)){
                auto previous = param_sources_.find(key);
                if(previous != param_sources_.end() && previous->second != type){
                    LOG_WARNING("parameter \"{}\" from {} overrides value from {}",
                                key, get_param_source_label(type), get_param_source_label(previous->second));

                    auto collision = std::find_if(collisions_.begin(), collisions_.end(),
                                                  [&key](const param_collision& c){ return c.key == key; });
                    if(collision == collisions_.end()){
                        collisions_.push_back({key, {previous->second, type}});
                    }else{
                        collision->sources.push_back(type);
                    }
                }
            }
            params[key] = it.value();
            param_sources_[key] = type;
        }
    }

    std::string request_context::debug_parameters() const{
        std::string result;
        for(const auto& [key, source] : param_sources_){
            if(!result.empty()) result += ", ";
            result += key + " <- " + get_param_source_label(source);
        }
        return result;
    }

}
