// src/io/UrlStream.cpp
#include "transread/io/UrlStream.hpp"
#include "transread/common/Constants.hpp"
#include <algorithm>
#include <cstring>

namespace {

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensureCurlGlobal() {
    static CurlGlobal global;
}

}

bool transread::io::UrlStream::isUrl(const std::string& candidate) {
    CURLU* handle = curl_url();
    if (!handle) {
        return false;
    }
    CURLUcode rc = curl_url_set(handle, CURLUPART_URL, candidate.c_str(), 0);
    curl_url_cleanup(handle);
    return rc == CURLUE_OK;
}

transread::io::UrlStream::UrlStream(const std::string& url, const common::ReaderConfig& config)
    : url_(url), easy_(nullptr), multi_(nullptr), pendingPos_(0), position_(0),
      done_(false), result_(CURLE_OK), responseCode_(0) {
    errorBuffer_[0] = '\0';

    if (!isUrl(url_)) {
        throw common::OpenError(common::ErrorCode::URL_MALFORMED,
                                "cannot open URL '" + url_ + "': not a valid absolute URL");
    }

    ensureCurlGlobal();

    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (!easy_ || !multi_) {
        close();
        throw common::OpenError(common::ErrorCode::URL_OPEN_FAILED,
                                "cannot open URL '" + url_ + "': failed to initialise libcurl");
    }

    configure(config);

    CURLMcode mc = curl_multi_add_handle(multi_, easy_);
    if (mc != CURLM_OK) {
        close();
        throw common::OpenError(common::ErrorCode::URL_OPEN_FAILED,
                                "cannot open URL '" + url_ + "': " + curl_multi_strerror(mc));
    }

    try {
        while (available() == 0 && !done_) {
            pump();
        }
    } catch (const common::IOError& e) {
        close();
        throw common::OpenError(common::ErrorCode::URL_OPEN_FAILED,
                                "cannot open URL '" + url_ + "': " + e.what());
    }

    if (done_ && result_ != CURLE_OK) {
        std::string reason = transferError();
        close();
        throw common::OpenError(common::ErrorCode::URL_OPEN_FAILED,
                                "cannot open URL '" + url_ + "': " + reason);
    }
}

transread::io::UrlStream::~UrlStream() {
    close();
}

void transread::io::UrlStream::configure(const common::ReaderConfig& config) {
    curl_easy_setopt(easy_, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &UrlStream::writeCallback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(easy_, CURLOPT_ERRORBUFFER, errorBuffer_);
    curl_easy_setopt(easy_, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, config.followRedirects ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT, config.connectTimeoutSeconds);
    curl_easy_setopt(easy_, CURLOPT_USERAGENT, config.userAgent.c_str());
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYPEER, config.verifyTls ? 1L : 0L);
    curl_easy_setopt(easy_, CURLOPT_SSL_VERIFYHOST, config.verifyTls ? 2L : 0L);

    if (config.bypassProxy) {
        // An empty proxy string disables proxies, including the ones from
        // http_proxy and friends.
        curl_easy_setopt(easy_, CURLOPT_PROXY, "");
        curl_easy_setopt(easy_, CURLOPT_NOPROXY, "*");
    }
}

void transread::io::UrlStream::close() {
    if (multi_ && easy_) {
        curl_multi_remove_handle(multi_, easy_);
    }
    if (easy_) {
        curl_easy_cleanup(easy_);
        easy_ = nullptr;
    }
    if (multi_) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }
    pending_.clear();
    pendingPos_ = 0;
}

size_t transread::io::UrlStream::writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* self = static_cast<UrlStream*>(userdata);
    size_t total = size * nmemb;
    self->pending_.insert(self->pending_.end(),
                          reinterpret_cast<common::Byte*>(data),
                          reinterpret_cast<common::Byte*>(data) + total);
    return total;
}

void transread::io::UrlStream::pump() {
    size_t before = available();

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
        throw common::IOError(common::ErrorCode::URL_READ_ERROR,
                              "cannot read " + describe() + ": " + curl_multi_strerror(mc));
    }

    if (running == 0) {
        collectResult();
        return;
    }

    if (available() > before) {
        return;
    }

    mc = curl_multi_poll(multi_, nullptr, 0,
                         static_cast<int>(common::Constants::URL_POLL_TIMEOUT_MS), nullptr);
    if (mc != CURLM_OK) {
        throw common::IOError(common::ErrorCode::URL_READ_ERROR,
                              "cannot read " + describe() + ": " + curl_multi_strerror(mc));
    }
}

void transread::io::UrlStream::collectResult() {
    int remaining = 0;
    CURLMsg* message = nullptr;
    while ((message = curl_multi_info_read(multi_, &remaining)) != nullptr) {
        if (message->msg == CURLMSG_DONE && message->easy_handle == easy_) {
            result_ = message->data.result;
        }
    }
    curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &responseCode_);
    done_ = true;
}

std::string transread::io::UrlStream::transferError() const {
    std::string reason = errorBuffer_[0] != '\0' ? std::string(errorBuffer_)
                                                 : std::string(curl_easy_strerror(result_));
    if (result_ == CURLE_HTTP_RETURNED_ERROR && responseCode_ != 0 &&
        reason.find(std::to_string(responseCode_)) == std::string::npos) {
        reason += " (HTTP " + std::to_string(responseCode_) + ")";
    }
    return reason;
}

void transread::io::UrlStream::read(common::ByteArray& buffer, size_t bytesToRead) {
    if (!easy_) {
        throw common::IOError(common::ErrorCode::STREAM_CLOSED,
                              "cannot read " + describe() + ": stream is closed");
    }

    buffer.clear();
    if (bytesToRead == 0) {
        return;
    }

    while (available() < bytesToRead && !done_) {
        pump();
    }

    if (available() == 0 && done_ && result_ != CURLE_OK) {
        throw common::IOError(common::ErrorCode::URL_READ_ERROR,
                              "cannot read " + describe() + ": " + transferError());
    }

    size_t readSize = std::min(bytesToRead, available());
    buffer.assign(pending_.begin() + pendingPos_, pending_.begin() + pendingPos_ + readSize);
    pendingPos_ += readSize;
    position_ += readSize;

    if (pendingPos_ == pending_.size()) {
        pending_.clear();
        pendingPos_ = 0;
    } else if (pendingPos_ > pending_.size() / 2) {
        pending_.erase(pending_.begin(), pending_.begin() + pendingPos_);
        pendingPos_ = 0;
    }
}
