#include "wireline/cancellation.hpp"

#include <utility>
#include <vector>

namespace wireline {

    CancellationToken::Registration::Registration(
        Registration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {
        other.id_ = 0;
    }

    CancellationToken::Registration&
    CancellationToken::Registration::operator=(Registration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void CancellationToken::Registration::reset() noexcept {
        if (id_ == 0) return;
        if (auto st = state_.lock()) {
            std::lock_guard<std::mutex> lk(st->mu);
            st->callbacks.erase(id_);
        }
        state_.reset();
        id_ = 0;
    }

    bool CancellationToken::cancelled() const noexcept {
        return reason() != CancelReason::None;
    }

    CancelReason CancellationToken::reason() const noexcept {
        if (!state_) return CancelReason::None;
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->reason;
    }

    CancellationToken::Registration CancellationToken::on_cancel(
        std::function<void()> fn) const {
        if (!state_) return {};
        {
            std::lock_guard<std::mutex> lk(state_->mu);
            if (state_->reason == CancelReason::None) {
                auto id = state_->next_id++;
                state_->callbacks.emplace(id, std::move(fn));
                return Registration(state_, id);
            }
        }
        fn();
        return {};
    }

    CancellationSource::CancellationSource()
        : state_(std::make_shared<detail::CancelState>()) {}

    CancellationSource::CancellationSource(const CancellationToken& parent)
        : CancellationSource() {
        std::weak_ptr<detail::CancelState> weak = state_;
        std::weak_ptr<detail::CancelState> parent_weak = parent.state_;
        parent_link_ = parent.on_cancel([weak, parent_weak] {
            auto child = weak.lock();
            auto par = parent_weak.lock();
            if (!child) return;
            CancelReason r = CancelReason::Requested;
            if (par) {
                std::lock_guard<std::mutex> lk(par->mu);
                r = par->reason;
            }
            CancellationSource::fire(child, r);
        });
    }

    void CancellationSource::cancel(CancelReason reason) {
        fire(state_, reason);
    }

    void CancellationSource::fire(
        const std::shared_ptr<detail::CancelState>& st, CancelReason reason) {
        if (reason == CancelReason::None) reason = CancelReason::Requested;

        std::map<std::uint64_t, std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lk(st->mu);
            if (st->reason != CancelReason::None) return;
            st->reason = reason;
            to_run.swap(st->callbacks);
        }

        // Run outside the lock; callbacks may register or cancel further.
        for (auto& [id, fn] : to_run) {
            (void)id;
            if (fn) fn();
        }
    }

    bool CancellationSource::cancelled() const noexcept {
        return reason() != CancelReason::None;
    }

    CancelReason CancellationSource::reason() const noexcept {
        std::lock_guard<std::mutex> lk(state_->mu);
        return state_->reason;
    }

}  // namespace wireline
