#include "restjson/response_sink.hpp"
#include <algorithm>
#include <cctype>

namespace restjson
{
    bool ResponseRecorder::CaseInsensitiveLess::operator()(const std::string &a, const std::string &b) const
    {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
                                            [](unsigned char x, unsigned char y) {
                                                return std::tolower(x) < std::tolower(y);
                                            });
    }

    ResponseRecorder::ResponseRecorder() = default;

    void ResponseRecorder::set_header(std::string_view key, std::string_view value)
    {
        headers_[std::string(key)] = std::string(value);
    }

    void ResponseRecorder::set_status(int code)
    {
        if (wrote_header_)
            return;
        status_ = code;
        wrote_header_ = true;
        sent_headers_ = headers_;
    }

    Result<std::size_t> ResponseRecorder::write(std::string_view bytes)
    {
        if (!wrote_header_)
            set_status(200);
        if (write_failure_)
            return std::unexpected(RestError::io(*write_failure_));
        body_.append(bytes);
        return bytes.size();
    }

    void ResponseRecorder::fail_writes(std::string message)
    {
        write_failure_ = std::move(message);
    }

    std::optional<std::string> ResponseRecorder::header(std::string_view key) const
    {
        const auto &headers = wrote_header_ ? sent_headers_ : headers_;
        auto it = headers.find(std::string(key));
        if (it == headers.end())
            return std::nullopt;
        return it->second;
    }

} // namespace restjson
