/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/engine.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace qnet
{

namespace
{

constexpr std::chrono::milliseconds CLAIM_POLL_INTERVAL{5};

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

ENGINE::CHANNEL_CLAIM::CHANNEL_CLAIM(ENGINE* e, CHANNEL* ch)
    :engine_(e),
    channel_(ch)
{}

ENGINE::CHANNEL_CLAIM::~CHANNEL_CLAIM()
{
    engine_->release_channel(channel_);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

ENGINE::ENGINE(const NETWORK_SPEC& spec, ENGINE_CONFIG conf)
    :config(conf),
    resources_(),
    network_(build_network(spec, resources_, config))
{
    log("ENGINE: built network `" + network_.name + "` (" + std::string{to_string(network_.topology)}
            + "): " + std::to_string(network_.node_count()) + " nodes, "
            + std::to_string(network_.link_count()) + " links, "
            + std::to_string(network_.channel_count()) + " channels");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

PROTOCOL_RESULT
ENGINE::execute(const PROTOCOL_INVOCATION& inv, CANCEL_TOKEN* token)
{
    uint64_t idx = invocation_counter_.fetch_add(1);
    s_invocations_[inv.index()]++;

    std::seed_seq seq{static_cast<uint32_t>(config.seed),
                        static_cast<uint32_t>(config.seed >> 32),
                        static_cast<uint32_t>(idx),
                        static_cast<uint32_t>(idx >> 32)};
    EXECUTION ex{.index=idx, .rng=rng_type{seq}, .token=token};

    log("ENGINE: invocation " + std::to_string(idx) + " (" + std::string{protocol_name(inv)} + ") started");

    auto t_start = std::chrono::steady_clock::now();
    try
    {
        std::visit([this, &ex] (const auto& req) { run(req, ex); }, inv);
        ex.result.status = RESULT_STATUS::COMPLETED;
    }
    catch (const NETWORK_ERROR& e)
    {
        ex.result.status = (e.kind == ERROR_KIND::SECURITY_ABORTED) ? RESULT_STATUS::ABORTED : RESULT_STATUS::FAILED;
        ex.result.error = e.kind;
        ex.result.message = e.what();
    }
    auto t_end = std::chrono::steady_clock::now();
    double walltime_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    std::string summary = summarize(ex.result);
    log("ENGINE: invocation " + std::to_string(idx) + " " + summary);
    {
        std::lock_guard<std::mutex> lg(log_mtx_);
        log_.push_back(EXECUTION_LOG_ENTRY{idx, protocol_name(inv), ex.result.status, summary, walltime_ms});
    }
    return std::move(ex.result);
}

std::vector<PROTOCOL_RESULT>
ENGINE::execute_all(const std::vector<PROTOCOL_INVOCATION>& invocations, size_t num_threads)
{
    std::vector<PROTOCOL_RESULT> results(invocations.size());
    if (num_threads <= 1)
    {
        for (size_t i = 0; i < invocations.size(); i++)
            results[i] = execute(invocations[i]);
        return results;
    }

    std::atomic<size_t> next{0};
    auto worker = [&] ()
    {
        for (size_t i = next.fetch_add(1); i < invocations.size(); i = next.fetch_add(1))
            results[i] = execute(invocations[i]);
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (size_t t = 0; t < num_threads; t++)
        threads.emplace_back(worker);
    for (auto& th : threads)
        th.join();
    return results;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NETWORK_QUBIT
ENGINE::qubit(const std::string& name) const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    return resources_.qubit(resources_.find_qubit(name));
}

ENTANGLED_PAIR
ENGINE::pair(const std::string& name) const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    return resources_.pair(resources_.find_pair(name));
}

bool
ENGINE::pair_intact(const std::string& name) const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    return resources_.is_intact(resources_.find_pair(name));
}

std::pair<std::string, std::string>
ENGINE::pair_qubits(const std::string& pair_name) const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    const ENTANGLED_PAIR& p = resources_.pair(resources_.find_pair(pair_name));
    return {resources_.qubit(p.first).name, resources_.qubit(p.second).name};
}

std::vector<std::string>
ENGINE::hosted_qubits(const node_id_type& id) const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    std::vector<std::string> out;
    for (const auto& [name, h] : network_.node(id).qubits)
        out.push_back(name);
    return out;
}

std::vector<std::string>
ENGINE::live_pairs() const
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    std::vector<std::string> out;
    for (pair_handle_type p : resources_.intact_pairs())
        out.push_back(resources_.pair(p).name);
    return out;
}

void
ENGINE::prepare_qubit(const std::string& name, uint8_t bit, BASIS b)
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    resources_.apply_basis_preparation(resources_.find_qubit(name), bit, b);
}

void
ENGINE::apply_pauli(const std::string& name, PAULI p)
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    resources_.apply_pauli(resources_.find_qubit(name), p);
}

uint8_t
ENGINE::measure(const std::string& name, BASIS b, rng_type& rng)
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    qubit_handle_type h = resources_.find_qubit(name);
    uint8_t out = resources_.measure(h, b, rng);
    unhost(h);
    return out;
}

std::string
ENGINE::create_pair(const node_id_type& a, const node_id_type& b, std::optional<double> fidelity)
{
    std::lock_guard<std::mutex> lg(resource_mtx_);
    pair_handle_type p = create_hosted_pair(a, b, fidelity.value_or(config.pair_fidelity));
    return resources_.pair(p).name;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

NETWORK_STATISTICS
ENGINE::statistics() const
{
    NETWORK_STATISTICS s;
    s.nodes = network_.node_count();
    s.links = network_.link_count();
    s.channels = network_.channel_count();
    s.diameter = network_diameter(network_);
    s.connectivity = connectivity_ratio(network_);

    for (const auto& l : network_.links())
    {
        for (const auto& ch : l->channels)
        {
            s.messages_sent += ch->messages_sent();
            s.messages_received += ch->messages_received();
            s.messages_rejected += ch->messages_rejected();
            s.messages_dropped += ch->messages_dropped();
        }
    }

    {
        std::lock_guard<std::mutex> lg(resource_mtx_);
        double fidelity_sum{0.0};
        for (pair_handle_type p : resources_.intact_pairs())
        {
            s.live_pairs++;
            fidelity_sum += resources_.pair(p).fidelity;
        }
        s.mean_pair_fidelity = mean(fidelity_sum, s.live_pairs);
    }

    s.pairs_created = s_pairs_created_.load();
    for (size_t i = 0; i < PROTOCOL_KIND_COUNT; i++)
        s.invocations[i] = s_invocations_[i].load();
    return s;
}

std::vector<EXECUTION_LOG_ENTRY>
ENGINE::execution_log() const
{
    std::lock_guard<std::mutex> lg(log_mtx_);
    return log_;
}

void
ENGINE::print_stats(std::ostream& out) const
{
    NETWORK_STATISTICS s = statistics();

    out << "NETWORK `" << network_.name << "`\n";
    print_stat_line(out, "NODES", s.nodes);
    print_stat_line(out, "LINKS", s.links);
    print_stat_line(out, "CHANNELS", s.channels);
    print_stat_line(out, "DIAMETER", s.diameter);
    print_stat_line(out, "CONNECTIVITY", s.connectivity);

    out << "RESOURCES\n";
    print_stat_line(out, "PAIRS_CREATED", s.pairs_created);
    print_stat_line(out, "LIVE_PAIRS", s.live_pairs);
    print_stat_line(out, "MEAN_LIVE_PAIR_FIDELITY", s.mean_pair_fidelity);

    out << "CHANNELS\n";
    print_stat_line(out, "MESSAGES_SENT", s.messages_sent);
    print_stat_line(out, "MESSAGES_RECEIVED", s.messages_received);
    print_stat_line(out, "MESSAGES_REJECTED", s.messages_rejected);
    print_stat_line(out, "MESSAGES_DROPPED", s.messages_dropped);

    out << "PROTOCOLS\n";
    for (size_t i = 0; i < PROTOCOL_KIND_COUNT; i++)
        print_stat_line(out, protocol_name(i), s.invocations[i]);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::log(const std::string& msg) const
{
    if (!config.verbose || config.log_strm == nullptr)
        return;
    std::lock_guard<std::mutex> lg(log_mtx_);
    *config.log_strm << msg << "\n";
}

ROUTE
ENGINE::route(const node_id_type& src, const node_id_type& dst) const
{
    return require_route(network_, src, dst, config.routing_policy);
}

void
ENGINE::advance_clock(const LINK& l)
{
    // ~5 us per km in fiber
    clock_ns_.fetch_add(static_cast<uint64_t>(l.distance * 5000.0));
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

CHANNEL*
ENGINE::claim_channel(const LINK& l, EXECUTION& ex, std::optional<std::string_view> channel_id)
{
    if (l.channels.empty())
        throw_resource_error("ENGINE::claim_channel: link has no channels -- " + l.id);

    auto try_all = [&l, channel_id] () -> CHANNEL*
    {
        for (const auto& ch : l.channels)
        {
            if (channel_id.has_value() && ch->id != *channel_id)
                continue;
            if (ch->try_claim())
                return ch.get();
        }
        return nullptr;
    };

    auto cancelled = [&ex] { return ex.token != nullptr && ex.token->is_cancelled(); };

    // the token only wakes channel receivers, so the wait is sliced to notice a cancel
    std::unique_lock<std::mutex> lk(claim_mtx_);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config.receive_timeout_ms);
    while (true)
    {
        if (CHANNEL* ch = try_all())
            return ch;
        if (cancelled())
            throw NETWORK_ERROR(ERROR_KIND::TIMED_OUT, "ENGINE::claim_channel: cancelled while waiting for link " + l.id);

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            throw NETWORK_ERROR(ERROR_KIND::TIMED_OUT, "ENGINE::claim_channel: all channels busy on link " + l.id);
        claim_cv_.wait_until(lk, std::min(deadline, now + CLAIM_POLL_INTERVAL));
    }
}

void
ENGINE::release_channel(CHANNEL* ch)
{
    // anything still queued belongs to the run giving up the claim
    size_t dropped = ch->drain();
    if (dropped > 0)
        log("ENGINE: dropped " + std::to_string(dropped) + " undelivered messages on channel " + ch->id);
    {
        std::lock_guard<std::mutex> lg(claim_mtx_);
        ch->release();
    }
    claim_cv_.notify_all();
}

RECEIVE_RESULT
ENGINE::receive_or_throw(CHANNEL* ch, EXECUTION& ex)
{
    RECEIVE_RESULT r = ch->receive(std::chrono::milliseconds(config.receive_timeout_ms), ex.token);
    if (r.status == RECEIVE_STATUS::TIMED_OUT)
        throw NETWORK_ERROR(ERROR_KIND::TIMED_OUT, "ENGINE::receive: timed out on channel " + ch->id);
    if (r.status == RECEIVE_STATUS::CANCELLED)
        throw NETWORK_ERROR(ERROR_KIND::TIMED_OUT, "ENGINE::receive: cancelled on channel " + ch->id);
    return r;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

classical_bits_type
ENGINE::relay_classical(const std::vector<node_id_type>& path, classical_bits_type bits, EXECUTION& ex)
{
    for (size_t i = 0; i+1 < path.size(); i++)
    {
        const LINK& l = network_.link(path[i], path[i+1]);
        CHANNEL_CLAIM ch(this, claim_channel(l, ex));

        if (ch->send(std::move(bits), path[i+1], path[i]) == SEND_STATUS::CAPACITY_EXCEEDED)
            throw NETWORK_ERROR(ERROR_KIND::CAPACITY_EXCEEDED, "ENGINE::relay_classical: channel full -- " + ch->id);

        RECEIVE_RESULT r = receive_or_throw(ch.get(), ex);
        auto* payload = std::get_if<classical_bits_type>(&r.message->payload);
        if (payload == nullptr)
            throw_state_error("ENGINE::relay_classical: expected classical bits on channel " + ch->id);
        bits = std::move(*payload);
        advance_clock(l);
    }
    return bits;
}

std::vector<QUANTUM_PAYLOAD>
ENGINE::relay_quantum(const std::vector<node_id_type>& path, std::vector<QUANTUM_PAYLOAD> photons, EXECUTION& ex)
{
    for (size_t i = 0; i+1 < path.size(); i++)
    {
        const LINK& l = network_.link(path[i], path[i+1]);
        CHANNEL_CLAIM ch(this, claim_channel(l, ex));
        if (ch->capacity == 0)
            throw NETWORK_ERROR(ERROR_KIND::CAPACITY_EXCEEDED, "ENGINE::relay_quantum: channel has no capacity -- " + ch->id);

        // send in batches that fit the channel, draining each batch at the far end
        std::vector<QUANTUM_PAYLOAD> arrived;
        arrived.reserve(photons.size());
        for (size_t j = 0; j < photons.size(); j += ch->capacity)
        {
            size_t batch_end = std::min(photons.size(), j + ch->capacity);
            for (size_t k = j; k < batch_end; k++)
            {
                apply_link_noise(photons[k].state, l.loss_rate, ex.rng);
                if (ch->send(photons[k], path[i+1], path[i]) == SEND_STATUS::CAPACITY_EXCEEDED)
                    throw NETWORK_ERROR(ERROR_KIND::CAPACITY_EXCEEDED, "ENGINE::relay_quantum: channel full -- " + ch->id);
            }
            for (size_t k = j; k < batch_end; k++)
            {
                RECEIVE_RESULT r = receive_or_throw(ch.get(), ex);
                auto* payload = std::get_if<QUANTUM_PAYLOAD>(&r.message->payload);
                if (payload == nullptr)
                    throw_state_error("ENGINE::relay_quantum: expected a qubit on channel " + ch->id);
                arrived.push_back(std::move(*payload));
            }
        }
        photons = std::move(arrived);
        advance_clock(l);
    }
    return photons;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::unhost(qubit_handle_type h)
{
    const NETWORK_QUBIT& q = resources_.qubit(h);
    if (q.transient)
        return;
    network_.node(q.owner).unhost(q.name);
}

void
ENGINE::consume_pair(pair_handle_type p, rng_type& rng)
{
    const ENTANGLED_PAIR& ep = resources_.pair(p);
    unhost(ep.first);
    unhost(ep.second);
    resources_.consume_pair(p, rng);
}

pair_handle_type
ENGINE::create_hosted_pair(const node_id_type& a, const node_id_type& b, double fidelity)
{
    if (a == b)
        throw_configuration_error("ENGINE::create_pair: both ends on the same node -- " + a);

    NODE& na = network_.node(a);
    NODE& nb = network_.node(b);
    if (na.free_slots() == 0)
        throw_resource_error("ENGINE::create_pair: node " + a + " is at capacity");
    if (nb.free_slots() == 0)
        throw_resource_error("ENGINE::create_pair: node " + b + " is at capacity");

    pair_handle_type p = resources_.create_entangled_pair(a, b, fidelity, now());
    s_pairs_created_++;

    const ENTANGLED_PAIR& ep = resources_.pair(p);
    na.host(resources_.qubit(ep.first).name, ep.first);
    nb.host(resources_.qubit(ep.second).name, ep.second);
    return p;
}

void
ENGINE::apply_route_noise(qubit_handle_type h, const std::vector<node_id_type>& path, rng_type& rng)
{
    for (size_t i = 0; i+1 < path.size(); i++)
    {
        const LINK& l = network_.link(path[i], path[i+1]);
        PAULI p = sample_link_noise(l.loss_rate, rng);
        if (p != PAULI::I)
            resources_.apply_pauli(h, p);
    }
}

pair_handle_type
ENGINE::create_transient_chain(const std::vector<node_id_type>& path, rng_type& rng)
{
    if (path.size() < 2)
        throw_configuration_error("ENGINE::create_transient_chain: path needs at least two nodes");

    std::vector<pair_handle_type> segments;
    for (size_t i = 0; i+1 < path.size(); i++)
    {
        pair_handle_type p = resources_.create_entangled_pair(path[i], path[i+1], config.pair_fidelity, now(), true);
        s_pairs_created_++;
        apply_route_noise(resources_.pair(p).second, {path[i], path[i+1]}, rng);
        segments.push_back(p);
    }

    // join segments left to right: the second half of the accumulated pair and the
    // first half of the next segment both live at path[i+1]
    pair_handle_type acc = segments[0];
    for (size_t i = 1; i < segments.size(); i++)
    {
        qubit_handle_type a = resources_.pair(acc).second,
                          b = resources_.pair(segments[i]).first;
        acc = resources_.swap(a, b, true, rng).pair;
    }
    return acc;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet
