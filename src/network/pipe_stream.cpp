#include "xfer/network/pipe_stream.hpp"

#include <algorithm>

namespace xfer::network {

void PipeStream::Channel::shut() {
    {
        std::lock_guard lock(mutex);
        closed = true;
    }
    cv.notify_all();
}

std::pair<std::unique_ptr<PipeStream>, std::unique_ptr<PipeStream>> PipeStream::create_pair() {
    auto a_to_b = std::make_shared<Channel>();
    auto b_to_a = std::make_shared<Channel>();
    std::unique_ptr<PipeStream> a(new PipeStream(b_to_a, a_to_b));
    std::unique_ptr<PipeStream> b(new PipeStream(a_to_b, b_to_a));
    return {std::move(a), std::move(b)};
}

PipeStream::PipeStream(std::shared_ptr<Channel> in, std::shared_ptr<Channel> out)
    : in_(std::move(in)), out_(std::move(out)) {
}

PipeStream::~PipeStream() {
    close();
}

Result<void> PipeStream::write_all(const std::uint8_t* data, std::size_t size) {
    {
        std::lock_guard lock(out_->mutex);
        if (out_->closed) {
            return Err<void>(std::string("Pipe closed"));
        }
        out_->bytes.insert(out_->bytes.end(), data, data + size);
    }
    out_->cv.notify_all();
    return Ok();
}

Result<std::size_t> PipeStream::read_some(std::uint8_t* buffer, std::size_t max_size) {
    std::unique_lock lock(in_->mutex);
    in_->cv.wait(lock, [this]() {
        return !in_->bytes.empty() || in_->closed;
    });

    const std::size_t count = std::min(max_size, in_->bytes.size());
    std::copy_n(in_->bytes.begin(), count, buffer);
    in_->bytes.erase(in_->bytes.begin(), in_->bytes.begin() + static_cast<std::ptrdiff_t>(count));
    return Ok(count);
}

void PipeStream::close() {
    in_->shut();
    out_->shut();
}

void PipeStream::close_write() {
    out_->shut();
}

} // namespace xfer::network
