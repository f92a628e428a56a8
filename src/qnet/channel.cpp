/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/channel.h"

#include <algorithm>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
CANCEL_TOKEN::cancel()
{
    cancelled_.store(true);

    std::lock_guard<std::mutex> lg(mtx_);
    for (CHANNEL* ch : waiting_)
        ch->wake();
}

void
CANCEL_TOKEN::attach(CHANNEL* ch)
{
    std::lock_guard<std::mutex> lg(mtx_);
    waiting_.push_back(ch);
}

void
CANCEL_TOKEN::detach(CHANNEL* ch)
{
    std::lock_guard<std::mutex> lg(mtx_);
    auto it = std::find(waiting_.begin(), waiting_.end(), ch);
    if (it != waiting_.end())
        waiting_.erase(it);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

CHANNEL::CHANNEL(std::string _id, size_t _capacity, double _fidelity, double _bandwidth)
    :id(_id),
    capacity(_capacity),
    fidelity(_fidelity),
    bandwidth(_bandwidth)
{}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

SEND_STATUS
CHANNEL::send(payload_type payload, const node_id_type& destination, const node_id_type& source)
{
    {
        std::lock_guard<std::mutex> lg(mtx_);
        if (queue_.size() >= capacity)
        {
            s_rejected_++;
            return SEND_STATUS::CAPACITY_EXCEEDED;
        }
        queue_.push_back(MESSAGE{std::move(payload), source, destination, sequence_++});
    }
    s_sent_++;
    cv_.notify_one();
    return SEND_STATUS::ACCEPTED;
}

RECEIVE_RESULT
CHANNEL::receive(std::chrono::milliseconds timeout, CANCEL_TOKEN* token)
{
    // the token must know about us before we check it under our own lock,
    // otherwise a cancel between the check and the wait would be lost
    if (token != nullptr)
        token->attach(this);

    RECEIVE_RESULT result{RECEIVE_STATUS::TIMED_OUT};
    {
        std::unique_lock<std::mutex> lk(mtx_);
        auto ready = [this, token]
                    {
                        return !queue_.empty() || (token != nullptr && token->is_cancelled());
                    };

        auto deadline = std::chrono::steady_clock::now() + timeout;
        bool woke = timeout.count() <= 0 ? ready() : cv_.wait_until(lk, deadline, ready);

        if (token != nullptr && token->is_cancelled())
        {
            result.status = RECEIVE_STATUS::CANCELLED;
        }
        else if (woke)
        {
            result.status = RECEIVE_STATUS::RECEIVED;
            result.message = std::move(queue_.front());
            queue_.pop_front();
            s_received_++;
        }
    }

    if (token != nullptr)
        token->detach(this);
    return result;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bool
CHANNEL::try_claim()
{
    bool expected{false};
    return busy_.compare_exchange_strong(expected, true);
}

void
CHANNEL::release()
{
    busy_.store(false);
}

size_t
CHANNEL::drain()
{
    std::lock_guard<std::mutex> lg(mtx_);
    size_t n = queue_.size();
    queue_.clear();
    s_dropped_ += n;
    return n;
}

size_t
CHANNEL::size() const
{
    std::lock_guard<std::mutex> lg(mtx_);
    return queue_.size();
}

void
CHANNEL::wake()
{
    // taking the lock orders the notification after any in-progress predicate check
    std::lock_guard<std::mutex> lg(mtx_);
    cv_.notify_all();
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

PAULI
sample_link_noise(double loss_rate, rng_type& rng)
{
    if (loss_rate <= 0.0)
        return PAULI::I;
    std::uniform_real_distribution<double> fp_rand{0.0, 1.0};
    if (fp_rand(rng) >= loss_rate)
        return PAULI::I;
    return random_pauli_error(rng);
}

bool
apply_link_noise(QUBIT_STATE& q, double loss_rate, rng_type& rng)
{
    PAULI p = sample_link_noise(loss_rate, rng);
    if (p == PAULI::I)
        return false;
    apply_pauli(q, p);
    return true;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet
