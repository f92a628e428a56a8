/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "argparse.h"
#include "qnet.h"

#include <iostream>
#include <string>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

qnet::ROUTING_POLICY
routing_policy_from_string(const std::string& s)
{
    if (s == "hops")
        return qnet::ROUTING_POLICY::HOP_COUNT;
    if (s == "fidelity")
        return qnet::ROUTING_POLICY::FIDELITY;
    if (s == "loss")
        return qnet::ROUTING_POLICY::LOSS;
    qnet::throw_configuration_error("routing_policy_from_string: unknown routing policy -- " + s);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main(int argc, char* argv[])
{
    std::string decl_file;
    std::string log_file;
    std::string routing;
    uint64_t    seed;
    int64_t     num_threads;
    int64_t     purify_rounds;
    uint64_t    timeout_ms;
    double      pair_fidelity;
    double      teleport_bound;
    double      default_loss;
    bool        verbose;

    try
    {
        bool ok = ARGPARSE()
                    .required("decl-file", "Network declaration (plain, .gz, or .xz)", decl_file)
                    .optional("-s", "--seed", "Random seed", seed, 0)
                    .optional("-t", "--threads", "Worker threads", num_threads, 1)
                    .optional("-o", "--log-file", "Execution log output (plain or .gz)", log_file, "")
                    .optional("-r", "--routing", "Routing policy (hops, fidelity, loss)", routing, "hops")
                    .optional("-f", "--pair-fidelity", "Single-link Bell pair fidelity", pair_fidelity, 0.95)
                    .optional("-b", "--teleport-bound", "Upper bound on teleported fidelity", teleport_bound, 0.95)
                    .optional("", "--default-loss", "Loss rate of generated links", default_loss, 0.01)
                    .optional("", "--purify-rounds", "Purification rounds for `entangle ... purify`", purify_rounds, 1)
                    .optional("", "--timeout-ms", "Receive timeout (ms)", timeout_ms, 1000)
                    .optional("-v", "--verbose", "Verbose flag", verbose, false)
                    .parse(argc, argv);
        if (!ok)
            return 0;
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    try
    {
        if (num_threads < 1)
            qnet::throw_configuration_error("qnet: --threads must be at least 1");
        if (purify_rounds < 0 || purify_rounds > static_cast<int64_t>(qnet::MAX_PURIFY_ROUNDS))
        {
            qnet::throw_configuration_error("qnet: --purify-rounds must be in [0, "
                                            + std::to_string(qnet::MAX_PURIFY_ROUNDS) + "]");
        }

        qnet::ENGINE_CONFIG conf{
            .seed=seed,
            .pair_fidelity=pair_fidelity,
            .teleport_fidelity_bound=teleport_bound,
            .purify_rounds=static_cast<size_t>(purify_rounds),
            .receive_timeout_ms=timeout_ms,
            .default_loss_rate=default_loss,
            .routing_policy=routing_policy_from_string(routing),
            .verbose=verbose,
            .log_strm=&std::cout
        };

        qnet::walltime_start();
        qnet::DECLARATION decl = qnet::read_declaration(decl_file);
        qnet::ENGINE engine(decl.network, conf);

        std::cout << "network " << decl.network.name << ": "
                    << engine.network().node_count() << " nodes, "
                    << engine.network().link_count() << " links, "
                    << decl.invocations.size() << " invocations\n";

        auto results = engine.execute_all(decl.invocations, static_cast<size_t>(num_threads));

        int exit_code{0};
        for (size_t i = 0; i < results.size(); i++)
        {
            std::cout << "[" << i << "] " << qnet::protocol_name(decl.invocations[i]) << ": "
                        << qnet::summarize(results[i]) << "\n";
            if (results[i].status == qnet::RESULT_STATUS::FAILED)
                exit_code = 2;

            if (!verbose)
                continue;
            if (const auto* rec = std::get_if<qnet::BB84_RECORD>(&results[i].record); rec && rec->key.has_value())
                std::cout << "\tkey: " << qnet::bits_to_string(*rec->key) << "\n";
            if (const auto* rec = std::get_if<qnet::E91_RECORD>(&results[i].record); rec && !rec->key.empty())
                std::cout << "\tkey: " << qnet::bits_to_string(rec->key) << "\n";
        }

        engine.print_stats(std::cout);
        print_stat_line(std::cout, "WALLTIME_S", qnet::walltime_s(), false);
        if (verbose)
            std::cout << "finished in " << qnet::walltime() << "\n";

        if (!log_file.empty())
            qnet::write_execution_log(log_file, engine.execution_log());
        return exit_code;
    }
    catch (const qnet::NETWORK_ERROR& e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////
