#include "docs/online_source.hpp"

#include "docs/text_utils.hpp"

#include <curl/curl.h>

namespace {

constexpr size_t MAX_BODY_BYTES = 512 * 1024;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    size_t n = size * nmemb;
    if (resp->size() + n > MAX_BODY_BYTES) return 0; // aborts the transfer
    resp->append(ptr, n);
    return n;
}

} // namespace

OnlineSource::OnlineSource(std::map<std::string, std::string> url_patterns)
    : url_patterns_(std::move(url_patterns)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

OnlineSource::~OnlineSource() {
    curl_global_cleanup();
}

std::string OnlineSource::url_for(const std::string& command) const {
    auto it = url_patterns_.find(command);
    if (it == url_patterns_.end()) it = url_patterns_.find("default");
    if (it == url_patterns_.end() || it->second.empty()) return {};

    std::string escaped = command;
    if (char* e = curl_easy_escape(nullptr, command.c_str(), static_cast<int>(command.size()))) {
        escaped = e;
        curl_free(e);
    }

    std::string url = it->second;
    const std::string placeholder = "{query}";
    for (auto pos = url.find(placeholder); pos != std::string::npos;
         pos = url.find(placeholder, pos + escaped.size())) {
        url.replace(pos, placeholder.size(), escaped);
    }
    return url;
}

std::expected<std::string, std::string> OnlineSource::fetch(const std::string& command) {
    auto url = url_for(command);
    if (url.empty()) return std::unexpected("no URL pattern for " + command);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string body;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "wingman");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && body.size() > 0)) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_code >= 400) {
        return std::unexpected("HTTP " + std::to_string(http_code) + " from " + url);
    }

    auto text = text::strip_html(body);
    if (text::trim(text).empty()) return std::unexpected("empty response from " + url);
    return text;
}
