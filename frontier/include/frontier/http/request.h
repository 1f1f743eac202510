#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace frontier {

/**
 * @brief Metadata key under which the slot is stored in serialized requests
 *
 * Shared with the downloader so that scheduling and download concurrency
 * partition requests the same way.
 */
inline constexpr const char* SLOT_META_KEY = "download_slot";

/**
 * @brief A unit of work waiting to be dispatched
 *
 * The scheduler never changes a request's identity. The only field it
 * writes is the slot, through set_slot(), when no override was provided.
 *
 * @example
 * ```cpp
 * Request req("https://example.com/page", 10);
 * req.set_slot("example-pool");              // optional override
 * req.meta()["depth"] = 2;
 * ```
 */
class Request {
public:
    explicit Request(std::string url, int priority = 0);

    Request(const Request& other) = default;
    Request& operator=(const Request& other) = default;
    Request(Request&& other) = default;
    Request& operator=(Request&& other) = default;
    ~Request() = default;

    // ========================================================================
    // Basic fields
    // ========================================================================

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

    [[nodiscard]] int priority() const noexcept { return priority_; }
    void set_priority(int priority) noexcept { priority_ = priority; }

    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    void set_method(std::string method) { method_ = std::move(method); }

    [[nodiscard]] const std::string& body() const noexcept { return body_; }
    void set_body(std::string body) { body_ = std::move(body); }

    [[nodiscard]] const std::map<std::string, std::string>& headers() const noexcept { return headers_; }
    void set_header(const std::string& key, std::string value);

    /**
     * @brief Open-ended metadata, always a JSON object
     */
    [[nodiscard]] nlohmann::json& meta() noexcept { return meta_; }
    [[nodiscard]] const nlohmann::json& meta() const noexcept { return meta_; }

    // ========================================================================
    // Slot accessors
    // ========================================================================

    /**
     * @brief Explicit slot override, or the value computed on first enqueue
     * @return Slot key, or std::nullopt if neither has happened yet
     */
    [[nodiscard]] const std::optional<std::string>& slot() const noexcept { return slot_; }

    /**
     * @brief Set or clear the slot override
     */
    void set_slot(std::optional<std::string> slot) { slot_ = std::move(slot); }

    // ========================================================================
    // Serialization
    // ========================================================================

    /**
     * @brief Encode as a key-value document
     *
     * The slot is written into meta under SLOT_META_KEY.
     */
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Decode the key-value form of a request
     * @throws InvalidRequestException if the document is not an object or
     *         lacks a string "url"
     */
    static Request from_json(const nlohmann::json& document);

    bool operator==(const Request& other) const = default;

private:
    std::string url_;
    int priority_ = 0;
    std::string method_ = "GET";
    std::map<std::string, std::string> headers_;
    std::string body_;
    nlohmann::json meta_ = nlohmann::json::object();
    std::optional<std::string> slot_;
};

} // namespace frontier
