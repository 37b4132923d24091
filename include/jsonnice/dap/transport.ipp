// transport.ipp - implementation file for the message transports

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

namespace jsonnice::dap {

JSONNICE_INLINE auto encode_frame(const std::string& body) -> std::string {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

// =============================================================================
// stream_transport_t implementation
// =============================================================================

JSONNICE_INLINE stream_transport_t::stream_transport_t(std::shared_ptr<::dap::Reader> reader,
                                                       std::shared_ptr<::dap::Writer> writer,
                                                       std::string name)
    : reader_(std::move(reader))
    , writer_(std::move(writer))
    , name_(std::move(name))
{
}

JSONNICE_INLINE stream_transport_t::stream_transport_t(const std::shared_ptr<::dap::ReaderWriter>& stream,
                                                       std::string name)
    : stream_transport_t(stream, stream, std::move(name))
{
}

JSONNICE_INLINE auto stream_transport_t::read_message() -> std::optional<std::string> {
    return read_frame(*this);
}

// Headers are read a byte at a time so nothing past the blank line is
// consumed; dap::file readers block until every requested byte arrives.
JSONNICE_INLINE auto stream_transport_t::read_line(std::string& line) -> bool {
    line.clear();
    auto c = char{};
    while (reader_->read(&c, 1) == 1) {
        if (c == '\n') {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }
        if (line.size() == max_header_line) {
            throw protocol_error("message header line longer than "
                                 + std::to_string(max_header_line) + " bytes");
        }
        line.push_back(c);
    }
    // End of stream: a partial line is still a line
    return !line.empty();
}

JSONNICE_INLINE auto stream_transport_t::read_exact(std::size_t size) -> std::string {
    auto body = std::string(size, '\0');
    auto got = std::size_t{0};
    while (got < size) {
        auto n = reader_->read(body.data() + got, size - got);
        if (n == 0) {
            throw protocol_error("truncated message body: expected " + std::to_string(size)
                                 + " bytes, got " + std::to_string(got));
        }
        got += n;
    }
    return body;
}

JSONNICE_INLINE void stream_transport_t::write_message(const std::string& body) {
    auto frame = encode_frame(body);
    if (!writer_->write(frame.data(), frame.size())) {
        throw transport_error(name_ + ": write failed");
    }
}

JSONNICE_INLINE void stream_transport_t::close() {
    reader_->close();
    writer_->close();
}

} // namespace jsonnice::dap

#undef JSONNICE_INLINE
