#include "frontier/scheduler/slot.h"
#include "frontier/core/exceptions.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace frontier {

namespace {

std::string md5_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_length, EVP_md5(), nullptr) != 1) {
        throw FrontierException("MD5 digest computation failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace

std::string extract_host(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return "";
    }

    size_t authority_start = scheme_end + 3;
    size_t authority_end = url.find_first_of("/?#", authority_start);
    if (authority_end == std::string::npos) {
        authority_end = url.length();
    }
    std::string authority = url.substr(authority_start, authority_end - authority_start);

    // Strip user info
    size_t at_pos = authority.rfind('@');
    if (at_pos != std::string::npos) {
        authority = authority.substr(at_pos + 1);
    }

    std::string host;
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal
        size_t close_pos = authority.find(']');
        if (close_pos == std::string::npos) {
            return "";
        }
        host = authority.substr(1, close_pos - 1);
    } else {
        size_t port_pos = authority.find(':');
        host = port_pos == std::string::npos ? authority : authority.substr(0, port_pos);
    }

    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return host;
}

std::string resolve_slot(Request& request) {
    if (const auto& slot = request.slot()) {
        return *slot;
    }

    std::string slot = extract_host(request.url());
    request.set_slot(slot);
    return slot;
}

std::string slot_of(const Request& request) {
    if (const auto& slot = request.slot()) {
        return *slot;
    }
    return extract_host(request.url());
}

std::string resolve_slot(nlohmann::json& document) {
    if (!document.is_object()) {
        throw InvalidRequestException(std::string("bad type of request '") +
                                      document.type_name() + "'");
    }

    auto& meta = document["meta"];
    if (meta.is_null()) {
        meta = nlohmann::json::object();
    } else if (!meta.is_object()) {
        throw InvalidRequestException("'meta' must be a key-value mapping");
    }

    auto slot_it = meta.find(SLOT_META_KEY);
    if (slot_it != meta.end() && !slot_it->is_null()) {
        return slot_it->is_string() ? slot_it->get<std::string>() : slot_it->dump();
    }

    std::string url;
    if (auto url_it = document.find("url"); url_it != document.end() && url_it->is_string()) {
        url = url_it->get<std::string>();
    }

    std::string slot = extract_host(url);
    meta[SLOT_META_KEY] = slot;
    return slot;
}

std::string slot_to_path(const std::string& slot) {
    std::string pathable = slot;
    for (auto& c : pathable) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '.' && c != '_') {
            c = '_';
        }
    }

    return pathable + "-" + md5_hex(slot);
}

} // namespace frontier
