#include <medusa/net/session.hpp>
#include <medusa/util/log.hpp>
#include <asio/bind_executor.hpp>
#include <asio/write.hpp>

using asio::ip::tcp;

namespace medusa {

    Session::Session(tcp::socket sock, Router& router, ThreadPool& pool,
        SessionOptions opts, std::shared_ptr<std::atomic<std::size_t>> live)
        : socket_(std::move(sock))
        , strand_(asio::make_strand(socket_.get_executor()))
        , timer_(strand_)
        , router_(router)
        , pool_(pool)
        , opts_(opts)
        , live_(std::move(live)) {
        inbuf_.resize(8 * 1024);
        std::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    Session::~Session() {
        if (live_) --*live_;
        log::info("client disconnected: " + peer_);
    }

    void Session::start() {
        log::info("client connected: " + peer_);
        auto self = shared_from_this();
        asio::dispatch(strand_, [this, self] {
            enqueue_write(reply_raw(kBanner));
            arm_timer();
            do_read();
            });
    }

    void Session::arm_timer() {
        if (!opts_.enable_timeouts) return;
        timer_.expires_after(opts_.idle_timeout);
        auto self = shared_from_this();
        timer_.async_wait([this, self](const asio::error_code& ec) {
            if (ec) return; // cancelled or re-armed
            log::info("idle timeout, closing " + peer_);
            close();
            });
    }

    void Session::do_read() {
        auto self = shared_from_this();
        socket_.async_read_some(asio::buffer(inbuf_),
            asio::bind_executor(strand_, [this, self](std::error_code ec, std::size_t n) {
                if (ec) {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                        log::debug("read error from " + peer_ + ": " + ec.message());
                    close();
                    return;
                }
                arm_timer();
                pending_.append(inbuf_.data(), n);

                std::vector<Pending> batch;
                for (;;) {
                    auto res = parse_line(pending_.data(), pending_.size(), opts_.max_line_length);
                    if (!res.req && res.error.empty()) break;       // need more
                    pending_.erase(0, res.consumed);
                    if (!res.error.empty()) {
                        log::debug("protocol error from " + peer_ + ": " + res.error);
                        batch.push_back({ {}, res.error, res.fatal });
                        if (res.fatal) { pending_.clear(); break; }
                        continue;
                    }
                    batch.push_back({ std::move(res.req->args), {}, false });
                }

                if (batch.empty()) { do_read(); return; }
                handle_batch(std::move(batch));
            }));
    }

    void Session::handle_batch(std::vector<Pending> batch) {
        auto self = shared_from_this();
        pool_.post([this, self, batch = std::move(batch)] {
            std::vector<std::string> replies;
            bool quit = false;
            for (auto& p : batch) {
                if (!p.error.empty()) {
                    replies.push_back(reply_error("Protocol error: " + p.error));
                    if (p.fatal) { quit = true; break; }
                    continue;
                }
                Reply r = router_.dispatch(p.args);
                replies.push_back(std::move(r.text));
                if (r.close) { quit = true; break; }
            }
            asio::post(strand_, [this, self, replies = std::move(replies), quit]() mutable {
                if (closing_) return;
                for (auto& r : replies) enqueue_write(std::move(r));
                if (quit) { closing_ = true; return; }
                do_read();
                });
            });
    }

    void Session::enqueue_write(std::string msg) {
        bool writing = !outq_.empty();
        outq_.push_back(std::move(msg));
        if (!writing) do_write();
    }

    void Session::do_write() {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outq_.front()),
            asio::bind_executor(strand_,
                [this, self](std::error_code ec, std::size_t) {
                    if (ec) { outq_.clear(); close(); return; }
                    outq_.pop_front();
                    if (!outq_.empty()) do_write();
                    else if (closing_) close();
                }));
    }

    void Session::close() {
        closing_ = true;
        std::error_code ignored;
        timer_.cancel();
        socket_.shutdown(tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

} // namespace medusa
