#include "frontier/http/request.h"
#include "frontier/core/exceptions.h"

#include <algorithm>
#include <cctype>

namespace frontier {

Request::Request(std::string url, int priority)
    : url_(std::move(url))
    , priority_(priority) {
}

void Request::set_header(const std::string& key, std::string value) {
    // Header names are case-insensitive; store them lowercased
    std::string normalized = key;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    headers_[normalized] = std::move(value);
}

nlohmann::json Request::to_json() const {
    nlohmann::json j;
    j["url"] = url_;
    j["method"] = method_;
    j["priority"] = priority_;
    j["headers"] = headers_;
    j["body"] = body_;
    j["meta"] = meta_;

    if (slot_) {
        j["meta"][SLOT_META_KEY] = *slot_;
    }

    return j;
}

Request Request::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw InvalidRequestException(std::string("expected a key-value document, got ") +
                                      document.type_name());
    }

    auto url_it = document.find("url");
    if (url_it == document.end() || !url_it->is_string()) {
        throw InvalidRequestException("document has no string 'url' field");
    }

    Request request(url_it->get<std::string>());

    try {
        request.priority_ = document.value("priority", 0);
        request.method_ = document.value("method", std::string("GET"));
        request.body_ = document.value("body", std::string());

        if (auto headers_it = document.find("headers"); headers_it != document.end()) {
            request.headers_ = headers_it->get<std::map<std::string, std::string>>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw InvalidRequestException(std::string("field has the wrong type: ") + e.what());
    }

    if (auto meta_it = document.find("meta"); meta_it != document.end() && !meta_it->is_null()) {
        if (!meta_it->is_object()) {
            throw InvalidRequestException("'meta' must be a key-value mapping");
        }
        request.meta_ = *meta_it;

        // The slot lives in its typed field, not in meta
        auto slot_it = request.meta_.find(SLOT_META_KEY);
        if (slot_it != request.meta_.end()) {
            if (slot_it->is_string()) {
                request.slot_ = slot_it->get<std::string>();
            } else if (!slot_it->is_null()) {
                request.slot_ = slot_it->dump();
            }
            request.meta_.erase(slot_it);
        }
    }

    return request;
}

} // namespace frontier
