// output_writer.ipp - implementation file for output_writer_t

#ifdef JSONNICE_SEPARATE_COMPILATION
#define JSONNICE_INLINE
#else
#define JSONNICE_INLINE inline
#endif

#include <spdlog/spdlog.h>

namespace jsonnice::dap {

JSONNICE_INLINE output_writer_t::output_writer_t(transport_t& transport)
    : transport_(transport)
{
    worker_ = std::thread([this] { run(); });
}

JSONNICE_INLINE output_writer_t::~output_writer_t() {
    close();
}

JSONNICE_INLINE auto output_writer_t::enqueue(json message) -> bool {
    if (!queue_.send(std::move(message))) {
        spdlog::warn("output writer for {} is closed; dropping message", transport_.describe());
        return false;
    }
    return true;
}

JSONNICE_INLINE void output_writer_t::close() {
    queue_.close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

JSONNICE_INLINE void output_writer_t::run() {
    while (auto message = queue_.recv()) {
        (*message)["seq"] = next_seq_++;
        if (broken_) {
            continue;
        }
        auto text = message->dump(-1, ' ', false, json::error_handler_t::replace);
        try {
            transport_.write_message(text);
            ++written_;
            spdlog::debug("message sent: {}", text);
        } catch (const transport_error& e) {
            // Keep draining so producers never block on a dead connection
            spdlog::warn("failed to write to {}: {}", transport_.describe(), e.what());
            broken_ = true;
        }
    }
}

} // namespace jsonnice::dap

#undef JSONNICE_INLINE
