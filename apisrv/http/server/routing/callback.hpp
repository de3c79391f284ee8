#ifndef APISRV_HTTP_CALLBACK_HPP
#define APISRV_HTTP_CALLBACK_HPP

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
#include <variant>
#include "../../../util/types.hpp"

namespace apisrv::http {

/**
 * User callback that can be either a plain function returning R or a coroutine returning
 * awaitable<R>. Both forms are invoked through invoke(), which always yields an awaitable,
 * so pipeline stages never need to know which form was registered.
 */
template<typename R, typename... Args>
class callback {
public:
    using sync_callback = std::function<R(Args...)>;
    using async_callback = std::function<apisrv::awaitable<R>(Args...)>;

    callback() = default;

    template<typename F>
        requires (!std::same_as<std::remove_cvref_t<F>, callback>) && std::invocable<F&, Args...>
    callback(F&& function) {
        if constexpr (std::same_as<std::invoke_result_t<F&, Args...>, apisrv::awaitable<R>>) {
            callback_ = async_callback(std::forward<F>(function));
        } else {
            callback_ = sync_callback(std::forward<F>(function));
        }
    }

    explicit operator bool() const {
        return !std::holds_alternative<std::monostate>(callback_);
    }

    bool is_awaitable() const {
        return std::holds_alternative<async_callback>(callback_);
    }

    apisrv::awaitable<R> invoke(Args... args) const {
        if (auto* async = std::get_if<async_callback>(&callback_)) {
            co_return co_await (*async)(std::forward<Args>(args)...);
        }
        if constexpr (std::is_void_v<R>) {
            std::get<sync_callback>(callback_)(std::forward<Args>(args)...);
        } else {
            co_return std::get<sync_callback>(callback_)(std::forward<Args>(args)...);
        }
    }

private:
    std::variant<std::monostate, sync_callback, async_callback> callback_;
};

} // namespace apisrv::http

#endif // APISRV_HTTP_CALLBACK_HPP
