// include/transread/io/UrlStream.hpp
#ifndef TRANSREAD_URLSTREAM_HPP
#define TRANSREAD_URLSTREAM_HPP

#include "IStream.hpp"
#include "../common/Types.hpp"
#include "../common/Config.hpp"
#include <curl/curl.h>
#include <string>

namespace transread {
namespace io {

// Remote byte source. The transfer runs on a curl multi handle that is
// driven from read(), so data is pulled as the caller consumes it instead of
// being downloaded up front.
class UrlStream : public IStream, public common::NonCopyable {
private:
    std::string url_;
    CURL* easy_;
    CURLM* multi_;
    char errorBuffer_[CURL_ERROR_SIZE];
    
    common::ByteArray pending_;
    size_t pendingPos_;
    uint64_t position_;
    
    bool done_;
    CURLcode result_;
    long responseCode_;
    
public:
    // Performs the request up to the first body bytes. Throws OpenError when
    // the URL is malformed, unreachable or answered with an HTTP error.
    UrlStream(const std::string& url, const common::ReaderConfig& config);
    ~UrlStream() override;
    
    void read(common::ByteArray& buffer, size_t bytesToRead) override;
    uint64_t tell() const override { return position_; }
    void close() override;
    std::string describe() const override { return "URL '" + url_ + "'"; }
    
    const std::string& getUrl() const { return url_; }
    long getResponseCode() const { return responseCode_; }
    
    // True when the string parses as an absolute URL with a scheme.
    static bool isUrl(const std::string& candidate);
    
private:
    void configure(const common::ReaderConfig& config);
    void pump();
    void collectResult();
    size_t available() const { return pending_.size() - pendingPos_; }
    std::string transferError() const;
    
    static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata);
};

} // namespace io
} // namespace transread

#endif
