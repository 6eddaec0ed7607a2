#include "tix/router.hpp"
#include "tix/error.hpp"

namespace tix {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0;
}

Response Router::dispatch(const Request& req) const {
    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        return Response::failure(req.id, error::MethodNotFound,
                                 "Method not found: " + req.method);
    }

    try {
        auto result = it->second(req.params);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            return Response::success(req.id, std::move(*ok));
        }
        auto& err = std::get<ErrorObject>(result);
        return Response::failure(req.id, err.code, std::move(err.message));
    } catch (const TixProtocolError& e) {
        return Response::failure(req.id, e.code, e.what());
    } catch (const std::exception& e) {
        return Response::failure(req.id, error::InternalError, e.what());
    }
}

} // namespace tix
