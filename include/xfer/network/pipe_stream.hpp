#pragma once

#include "xfer/network/stream.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

namespace xfer::network {

/**
 * @brief In-process duplex byte stream
 *
 * create_pair() returns two connected ends. Bytes written on one end are
 * read on the other. Buffers are unbounded, so a single thread may write a
 * whole transfer before the other end starts reading. close() on either end
 * ends both directions and wakes blocked readers.
 */
class PipeStream : public ByteStream {
public:
    static std::pair<std::unique_ptr<PipeStream>, std::unique_ptr<PipeStream>> create_pair();

    ~PipeStream() override;

    using ByteStream::write_all;
    Result<void> write_all(const std::uint8_t* data, std::size_t size) override;
    Result<std::size_t> read_some(std::uint8_t* buffer, std::size_t max_size) override;
    void close() override;

    /// Ends only the outgoing direction; the peer reads EOF once drained.
    void close_write();

private:
    struct Channel {
        std::deque<std::uint8_t> bytes;
        bool closed = false;
        std::mutex mutex;
        std::condition_variable cv;

        void shut();
    };

    PipeStream(std::shared_ptr<Channel> in, std::shared_ptr<Channel> out);

    std::shared_ptr<Channel> in_;
    std::shared_ptr<Channel> out_;
};

} // namespace xfer::network
