/*
 *  author: qnet developers
 *  date:   18 October 2026
 *
 *  This file contains the classical send handler of `ENGINE`.
 * */

#include "qnet/engine.h"

#include <algorithm>

namespace qnet
{

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
ENGINE::run(const SEND_REQUEST& req, EXECUTION& ex)
{
    ex.result.record = SEND_RECORD{.source=req.source, .destination=req.destination, .sent=req.bits};
    SEND_RECORD& rec = std::get<SEND_RECORD>(ex.result.record);

    if (req.source == req.destination)
        throw_configuration_error("SEND: source and destination are the same node -- " + req.source);
    if (req.bits.empty())
        throw_configuration_error("SEND: message is empty");
    if (std::any_of(req.bits.begin(), req.bits.end(), [] (uint8_t b) { return b > 1; }))
        throw_configuration_error("SEND: message bits must be 0 or 1");

    ROUTE r = route(req.source, req.destination);
    rec.hops = r.hops();

    if (!req.channel.has_value())
    {
        rec.received = relay_classical(r.path, req.bits, ex);
        return;
    }

    CHANNEL* named = network_.find_channel(*req.channel);
    if (named == nullptr)
        throw_reference_error("SEND: unknown channel -- " + *req.channel);
    if (r.hops() != 1)
    {
        throw_configuration_error("SEND: a named channel needs adjacent nodes -- "
                                    + req.source + " and " + req.destination + " are " + std::to_string(r.hops()) + " hops apart");
    }

    const LINK& l = network_.link(req.source, req.destination);
    bool on_link = std::any_of(l.channels.begin(), l.channels.end(),
                                [named] (const auto& ch) { return ch.get() == named; });
    if (!on_link)
        throw_configuration_error("SEND: channel " + *req.channel + " is not on link " + l.id);
    rec.channel = *req.channel;

    CHANNEL_CLAIM ch(this, claim_channel(l, ex, named->id));
    if (ch->send(req.bits, req.destination, req.source) == SEND_STATUS::CAPACITY_EXCEEDED)
        throw NETWORK_ERROR(ERROR_KIND::CAPACITY_EXCEEDED, "SEND: channel full -- " + ch->id);

    RECEIVE_RESULT rr = receive_or_throw(ch.get(), ex);
    auto* payload = std::get_if<classical_bits_type>(&rr.message->payload);
    if (payload == nullptr)
        throw_state_error("SEND: expected classical bits on channel " + ch->id);
    rec.received = std::move(*payload);
    advance_clock(l);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet
