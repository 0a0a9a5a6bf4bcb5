#include "restjson/beast_sink.hpp"

namespace beast = boost::beast;

namespace restjson
{
    BeastResponseSink::BeastResponseSink(Response &res) : res_(res) {}

    void BeastResponseSink::set_header(std::string_view key, std::string_view value)
    {
        res_.set(beast::string_view(key.data(), key.size()),
                 beast::string_view(value.data(), value.size()));
    }

    void BeastResponseSink::set_status(int code)
    {
        if (status_set_)
            return;
        res_.result(static_cast<unsigned>(code));
        status_set_ = true;
    }

    Result<std::size_t> BeastResponseSink::write(std::string_view bytes)
    {
        if (!status_set_)
            set_status(200);
        try
        {
            res_.body().append(bytes.data(), bytes.size());
        }
        catch (const std::length_error &e)
        {
            return std::unexpected(RestError::io(e.what()));
        }
        return bytes.size();
    }

} // namespace restjson
