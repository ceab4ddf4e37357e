#include "mock_http.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <regex>

namespace test_utils {

namespace {

nlohmann::json releaseJson(const std::string& tag, const std::vector<ReleaseAsset>& assets) {
    nlohmann::json assetList = nlohmann::json::array();
    for (const auto& asset : assets) {
        assetList.push_back({ { "name", asset.name }, { "browser_download_url", asset.url } });
    }
    return { { "tag_name", tag }, { "assets", assetList } };
}

}  // namespace

void MockHttpClient::setResponse(const std::string& url, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_[url] = response;
}

void MockHttpClient::queueResponse(const std::string& url, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    queued_responses_[url].push_back(response);
}

void MockHttpClient::setPatternResponse(const std::string& pattern, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    pattern_responses_.emplace_back(pattern, response);
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::clearResponses() {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_.clear();
    queued_responses_.clear();
    pattern_responses_.clear();
    requests_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

MockResponse MockHttpClient::getResponse(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(url);

    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }

    auto queued = queued_responses_.find(url);
    if (queued != queued_responses_.end() && !queued->second.empty()) {
        MockResponse response = queued->second.front();
        queued->second.pop_front();
        return response;
    }

    // Check exact URL match first
    auto url_it = url_responses_.find(url);
    if (url_it != url_responses_.end()) {
        return url_it->second;
    }

    // Check pattern matches
    for (const auto& [pattern, response] : pattern_responses_) {
        if (std::regex_search(url, std::regex(pattern))) {
            return response;
        }
    }

    return MockResponses::not_found();
}

int MockHttpClient::requestCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    int count = 0;
    for (const auto& r : requests_) {
        if (r == url) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> MockHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

updater::HttpResponse MockHttpClient::toHttp(const MockResponse& response) const {
    updater::HttpResponse http;
    if (response.has_error) {
        http.error = response.error_message;
        return http;
    }
    http.status_code = response.status_code;
    http.text = response.body;
    return http;
}

updater::HttpResponse MockHttpClient::get(const std::string& url, const std::vector<updater::Header>&) {
    return toHttp(getResponse(url));
}

updater::HttpResponse MockHttpClient::download(const std::string& url, std::ofstream& out) {
    MockResponse response = getResponse(url);
    updater::HttpResponse http = toHttp(response);
    if (!response.has_error) {
        // Partial content is written even on error statuses, like a dropped transfer would
        out << response.body;
        http.text.clear();
    }
    return http;
}

MockResponse MockResponses::release(const std::string& tag, const std::vector<ReleaseAsset>& assets) {
    MockResponse response;
    response.body = releaseJson(tag, assets).dump();
    return response;
}

MockResponse MockResponses::release_list(
    const std::vector<std::pair<std::string, std::vector<ReleaseAsset>>>& releases) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& [tag, assets] : releases) {
        list.push_back(releaseJson(tag, assets));
    }
    MockResponse response;
    response.body = list.dump();
    return response;
}

MockResponse MockResponses::empty_list() {
    MockResponse response;
    response.body = "[]";
    return response;
}

MockResponse MockResponses::empty_body() {
    MockResponse response;
    response.body = "";
    return response;
}

MockResponse MockResponses::invalid_json() {
    MockResponse response;
    response.body = "invalid json{";
    return response;
}

MockResponse MockResponses::binary(const std::string& content) {
    MockResponse response;
    response.body = content;
    return response;
}

MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Network connection failed";
    return response;
}

MockResponse MockResponses::timeout_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Request timeout";
    return response;
}

MockResponse MockResponses::not_found() {
    MockResponse response;
    response.status_code = 404;
    response.body = "Not Found";
    return response;
}

}  // namespace test_utils
