/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "test_common.h"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_receive_on_empty_channel_times_out()
{
    CHANNEL ch("c", 4, 1.0, 1e9);
    RECEIVE_RESULT r = ch.receive(0ms);
    CHECK(r.status == RECEIVE_STATUS::TIMED_OUT, "timeout 0 on an empty channel");
    CHECK(!r.message.has_value(), "no message on timeout");

    auto t0 = std::chrono::steady_clock::now();
    r = ch.receive(30ms);
    auto elapsed = std::chrono::steady_clock::now() - t0;
    CHECK(r.status == RECEIVE_STATUS::TIMED_OUT, "timed wait on an empty channel");
    CHECK(elapsed >= 25ms, "receive waited for the timeout");
    printf("PASS: receive on empty channel times out\n");
}

void
test_send_then_receive()
{
    CHANNEL ch("c", 4, 1.0, 1e9);
    CHECK(ch.send(classical_bits_type{1, 0, 1}, "b", "a") == SEND_STATUS::ACCEPTED, "send accepted");

    QUANTUM_PAYLOAD qp{.state=prepare_basis_state(1, BASIS::X), .fidelity=0.9};
    CHECK(ch.send(qp, "b", "a") == SEND_STATUS::ACCEPTED, "send accepted");
    CHECK(ch.size() == 2, "two queued");

    RECEIVE_RESULT r = ch.receive(0ms);
    CHECK(r.status == RECEIVE_STATUS::RECEIVED, "received");
    CHECK(std::get<classical_bits_type>(r.message->payload) == classical_bits_type({1, 0, 1}), "same bits");
    CHECK(r.message->source == "a" && r.message->destination == "b", "addressing");
    CHECK(r.message->sequence == 0, "first sequence number");

    r = ch.receive(0ms);
    CHECK(r.status == RECEIVE_STATUS::RECEIVED, "received");
    const QUANTUM_PAYLOAD& got = std::get<QUANTUM_PAYLOAD>(r.message->payload);
    CHECK(got.state.equivalent_to(prepare_basis_state(1, BASIS::X)), "same state");
    CHECK(got.fidelity == 0.9, "same fidelity");
    CHECK(r.message->sequence == 1, "sequence numbers increase");

    CHECK(ch.messages_sent() == 2 && ch.messages_received() == 2, "counters");
    printf("PASS: send then receive\n");
}

void
test_capacity()
{
    CHANNEL ch("c", 2, 1.0, 1e9);
    CHECK(ch.send(classical_bits_type{0}, "b") == SEND_STATUS::ACCEPTED, "first fits");
    CHECK(ch.send(classical_bits_type{1}, "b") == SEND_STATUS::ACCEPTED, "second fits");
    CHECK(ch.send(classical_bits_type{1}, "b") == SEND_STATUS::CAPACITY_EXCEEDED, "third is rejected");
    CHECK(ch.size() == 2, "queue never exceeds capacity");
    CHECK(ch.messages_rejected() == 1, "rejection counted");

    ch.receive(0ms);
    CHECK(ch.send(classical_bits_type{1}, "b") == SEND_STATUS::ACCEPTED, "room after a receive");

    CHANNEL closed("z", 0, 1.0, 1e9);
    CHECK(closed.send(classical_bits_type{0}, "b") == SEND_STATUS::CAPACITY_EXCEEDED, "zero capacity");
    printf("PASS: capacity\n");
}

void
test_cancel()
{
    CHANNEL ch("c", 4, 1.0, 1e9);
    CANCEL_TOKEN token;

    auto t0 = std::chrono::steady_clock::now();
    std::thread canceller([&token] { std::this_thread::sleep_for(50ms); token.cancel(); });
    RECEIVE_RESULT r = ch.receive(10s, &token);
    canceller.join();
    auto elapsed = std::chrono::steady_clock::now() - t0;

    CHECK(r.status == RECEIVE_STATUS::CANCELLED, "pending receive is cancelled");
    CHECK(elapsed < 5s, "cancel wakes the receiver");

    // a cancelled token stays cancelled and leaves messages in place
    ch.send(classical_bits_type{1}, "b");
    r = ch.receive(1s, &token);
    CHECK(r.status == RECEIVE_STATUS::CANCELLED, "cancelled token returns at once");
    CHECK(ch.size() == 1, "cancellation does not drop the message");
    CHECK(ch.receive(0ms).status == RECEIVE_STATUS::RECEIVED, "message still there");
    printf("PASS: cancel\n");
}

void
test_claim()
{
    CHANNEL ch("c", 4, 1.0, 1e9);
    CHECK(!ch.busy(), "starts free");
    CHECK(ch.try_claim(), "first claim succeeds");
    CHECK(ch.busy(), "busy while claimed");
    CHECK(!ch.try_claim(), "second claim fails");
    CHECK(ch.send(classical_bits_type{1}, "b") == SEND_STATUS::ACCEPTED, "claim does not gate send");
    ch.release();
    CHECK(ch.try_claim(), "claim after release");
    printf("PASS: claim\n");
}

void
test_producer_consumer()
{
    CHANNEL ch("c", 8, 1.0, 1e9);
    const uint8_t count{200};
    std::thread producer([&ch, count]
                        {
                            for (uint8_t i = 0; i < count; )
                            {
                                if (ch.send(classical_bits_type{i}, "b") == SEND_STATUS::ACCEPTED)
                                    i++;
                                else
                                    std::this_thread::yield();
                            }
                        });

    bool in_order{true};
    for (uint8_t i = 0; i < count; i++)
    {
        RECEIVE_RESULT r = ch.receive(5s);
        if (r.status != RECEIVE_STATUS::RECEIVED || std::get<classical_bits_type>(r.message->payload)[0] != i)
            in_order = false;
    }
    producer.join();
    CHECK(in_order, "messages arrive in FIFO order");
    CHECK(ch.size() == 0, "drained");
    printf("PASS: producer consumer\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    printf("=== Channel Test ===\n");
    test_receive_on_empty_channel_times_out();
    test_send_then_receive();
    test_capacity();
    test_cancel();
    test_claim();
    test_producer_consumer();
    return 0;
}
