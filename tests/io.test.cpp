/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "test_common.h"
#include "argparse.h"
#include "generic_io.h"

#include <filesystem>

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

const std::vector<std::string> DECLARATION_LINES
{
    "# a small network",
    "network lab star",
    "node hub router 2 memory=4 coherence=5e5 pos=0,0,0",
    "node alice endpoint 1",
    "node bob endpoint 1   # trailing comment",
    "link alice bob distance=3.5 loss=0.02",
    "channel fast capacity=16 fidelity=0.99 bandwidth=2e9",
    "channel slow capacity=2",
    "",
    "bb84 alice bob 128 0.11",
    "e91 alice bob 64",
    "teleport alice bob alice_q0 pair=p0",
    "entangle ghz 0.8 alice hub bob",
    "entangle bell 0.9 purify alice bob",
    "purify 0.95 2 p0 p1",
    "swap hub_q0 hub_q1 nomeasure",
    "superdense alice bob 01 pair=p1",
    "send alice bob 1011 channel=fast",
    "send bob hub 0",
};

std::filesystem::path
temp_path(std::string name)
{
    return std::filesystem::temp_directory_path() / ("qnet_io_test_" + name);
}

void
write_lines(std::string path, const std::vector<std::string>& lines)
{
    generic_strm_type strm;
    generic_strm_open(strm, path, "w");
    for (const auto& l : lines)
        generic_strm_write(strm, l + "\n");
    generic_strm_close(strm);
}

std::vector<std::string>
read_lines(std::string path)
{
    generic_strm_type strm;
    generic_strm_open(strm, path, "r");
    std::vector<std::string> out;
    std::string line;
    while (generic_strm_getline(strm, line))
        out.push_back(line);
    CHECK(generic_strm_eof(strm), "stream is exhausted");
    generic_strm_close(strm);
    return out;
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_parse_network()
{
    DECLARATION d = parse_declaration(DECLARATION_LINES);
    const NETWORK_SPEC& n = d.network;
    CHECK(n.name == "lab" && n.topology == "star", "network line");
    CHECK(n.nodes.size() == 3, "three nodes");

    const NODE_SPEC& hub = n.nodes[0];
    CHECK(hub.kind == NODE_KIND::ROUTER && hub.qubit_count == 2, "hub kind and qubits");
    CHECK(hub.memory.has_value() && hub.memory->capacity == 4, "hub memory");
    CHECK(hub.memory->coherence_time_ns == 5e5, "hub coherence");
    CHECK(hub.position.has_value(), "hub position");
    CHECK(!n.nodes[1].memory.has_value() && !n.nodes[2].position.has_value(), "options are optional");

    CHECK(n.links.size() == 1, "one declared link");
    const LINK_SPEC& l = n.links[0];
    CHECK(l.source == "alice" && l.target == "bob", "link ends");
    CHECK(l.distance == 3.5 && l.loss_rate == 0.02, "link options");
    CHECK(l.channels.size() == 2, "channels attach to the last link");
    CHECK(l.channels[0].id == "fast" && l.channels[0].capacity == 16 && l.channels[0].fidelity == 0.99,
            "first channel");
    CHECK(l.channels[1].capacity == 2 && l.channels[1].fidelity == 1.0, "channel defaults");
    printf("PASS: parse network\n");
}

void
test_parse_invocations()
{
    DECLARATION d = parse_declaration(DECLARATION_LINES);
    CHECK(d.invocations.size() == 10, "ten invocations");

    const auto& bb84 = std::get<BB84_REQUEST>(d.invocations[0]);
    CHECK(bb84.key_length == 128 && bb84.security_threshold == 0.11, "bb84");
    CHECK(std::get<E91_REQUEST>(d.invocations[1]).key_length == 64, "e91");

    const auto& tp = std::get<TELEPORT_REQUEST>(d.invocations[2]);
    CHECK(tp.qubit == "alice_q0" && tp.pair == std::optional<std::string>{"p0"}, "teleport with pair");

    const auto& ghz = std::get<ENTANGLE_REQUEST>(d.invocations[3]);
    CHECK(ghz.kind == ENTANGLEMENT_KIND::GHZ && ghz.nodes.size() == 3 && !ghz.purify, "ghz");
    const auto& bell = std::get<ENTANGLE_REQUEST>(d.invocations[4]);
    CHECK(bell.purify && bell.nodes == std::vector<node_id_type>({"alice", "bob"}), "purify is not a node");

    const auto& pur = std::get<PURIFY_REQUEST>(d.invocations[5]);
    CHECK(pur.target_fidelity == 0.95 && pur.rounds == 2 && pur.pairs.size() == 2, "purify");
    CHECK(!std::get<SWAP_REQUEST>(d.invocations[6]).measure, "swap nomeasure");

    const auto& sd = std::get<SUPERDENSE_REQUEST>(d.invocations[7]);
    CHECK(sd.bits[0] == 0 && sd.bits[1] == 1 && sd.pair == std::optional<std::string>{"p1"}, "superdense");
    const auto& send = std::get<SEND_REQUEST>(d.invocations[8]);
    CHECK(send.bits == bit_vector_type({1, 0, 1, 1}) && send.channel == std::optional<std::string>{"fast"},
            "send on a named channel");
    CHECK(!std::get<SEND_REQUEST>(d.invocations[9]).channel.has_value(), "send without a channel");

    std::vector<size_t> kinds;
    for (const auto& inv : d.invocations)
        kinds.push_back(inv.index());
    CHECK(kinds == std::vector<size_t>({0, 1, 2, 3, 3, 4, 5, 6, 7, 7}), "file order");
    printf("PASS: parse invocations\n");
}

void
test_parse_errors()
{
    auto fails = [] (std::vector<std::string> lines, std::string where)
    {
        try
        {
            parse_declaration(lines);
        }
        catch (const NETWORK_ERROR& e)
        {
            return e.kind == ERROR_KIND::CONFIGURATION_ERROR
                    && std::string{e.what()}.find(where) != std::string::npos;
        }
        return false;
    };

    CHECK(fails({"network a mesh", "network b mesh"}, "line 2"), "network declared twice");
    CHECK(fails({"node a endpoint 1", "channel c"}, "line 2"), "channel before any link");
    CHECK(fails({"", "node a spaceship 1"}, "line 2"), "unknown node kind carries the line");
    CHECK(fails({"node a endpoint one"}, "line 1"), "qubit count is not a number");
    CHECK(fails({"node a endpoint 1 pos=1,2"}, "line 1"), "short position");
    CHECK(fails({"node a endpoint 1 color=red"}, "line 1"), "unknown node option");
    CHECK(fails({"link a b loss"}, "line 1"), "option without value");
    CHECK(fails({"bb84 a b"}, "line 1"), "missing argument");
    CHECK(fails({"purify 0.9 -1 p0"}, "line 1"), "negative rounds");
    CHECK(fails({"swap a b measure"}, "line 1"), "unknown swap option");
    CHECK(fails({"entangle line 0.9 a b"}, "line 1"), "unknown entanglement kind");
    CHECK(fails({"superdense a b 012"}, "line 1"), "superdense takes two bits");
    CHECK(fails({"superdense a b 0"}, "line 1"), "superdense needs both bits");
    CHECK(fails({"send a b 10x1"}, "line 1"), "send takes a bit string");
    CHECK(fails({"send a b 1 via=c"}, "line 1"), "unknown send option");
    CHECK(fails({"frobnicate"}, "line 1"), "unknown declaration");

    DECLARATION d = parse_declaration({"# nothing", "   "});
    CHECK(d.network.name == "network" && d.invocations.empty(), "empty declaration");
    printf("PASS: parse errors\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

void
test_read_declaration_files()
{
    for (std::string ext : {".txt", ".gz"})
    {
        std::string path = temp_path("decl" + ext).string();
        write_lines(path, DECLARATION_LINES);
        DECLARATION d = read_declaration(path);
        CHECK(d.network.nodes.size() == 3 && d.invocations.size() == 10, "declaration read back");
        std::filesystem::remove(path);
    }

    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR,
                        [] () { read_declaration(temp_path("does_not_exist.txt").string()); }),
            "missing file");
    printf("PASS: read declaration files\n");
}

void
test_write_execution_log()
{
    ENGINE engine(make_chain_spec(2, 0.0), make_test_config(21));
    engine.execute(BB84_REQUEST{.alice="n0", .bob="n1", .key_length=32});
    engine.execute(ENTANGLE_REQUEST{.nodes={"n0"}});

    std::string path = temp_path("log.gz").string();
    write_execution_log(path, engine.execution_log());
    auto lines = read_lines(path);
    std::filesystem::remove(path);

    CHECK(lines.size() == 2, "one line per entry");
    CHECK(lines[0].rfind("#0", 0) == 0 && lines[0].find("bb84") != std::string::npos, "first entry");
    CHECK(lines[1].rfind("#1", 0) == 0 && lines[1].find("entangle") != std::string::npos, "second entry");
    CHECK(lines[0].find("ms") != std::string::npos, "walltime is logged");

    CHECK(throws_kind(ERROR_KIND::CONFIGURATION_ERROR,
                        [&engine] () { write_execution_log("/nonexistent_dir/log.txt", engine.execution_log()); }),
            "unwritable path");
    printf("PASS: write execution log\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

bool
run_argparse(std::vector<std::string> args, std::string& decl, uint64_t& seed, double& f, bool& v)
{
    std::vector<char*> argv;
    for (auto& a : args)
        argv.push_back(a.data());
    return ARGPARSE()
            .required("decl-file", "declaration", decl)
            .optional("-s", "--seed", "seed", seed, 0)
            .optional("-f", "--pair-fidelity", "fidelity", f, 0.95)
            .optional("-v", "--verbose", "verbose", v, false)
            .parse(static_cast<int>(argv.size()), argv.data());
}

void
test_argparse()
{
    std::string decl;
    uint64_t seed;
    double f;
    bool v;

    CHECK(run_argparse({"qnet", "net.txt"}, decl, seed, f, v), "defaults");
    CHECK(decl == "net.txt" && seed == 0 && f == 0.95 && !v, "default values");

    CHECK(run_argparse({"qnet", "net.txt", "-s", "42", "--pair-fidelity", "0.9", "-v"}, decl, seed, f, v),
            "options");
    CHECK(seed == 42 && f == 0.9 && v, "option values");

    CHECK(!run_argparse({"qnet", "--help"}, decl, seed, f, v), "help stops parsing");

    auto rejects = [&] (std::vector<std::string> args)
    {
        try
        {
            run_argparse(args, decl, seed, f, v);
        }
        catch (const std::invalid_argument&)
        {
            return true;
        }
        return false;
    };
    CHECK(rejects({"qnet"}), "missing required argument");
    CHECK(rejects({"qnet", "-v"}), "flag in place of required argument");
    CHECK(rejects({"qnet", "net.txt", "-s"}), "option without value");
    CHECK(rejects({"qnet", "net.txt", "-s", "-3"}), "negative unsigned value");
    CHECK(rejects({"qnet", "net.txt", "-f", "0.9x"}), "trailing garbage");
    CHECK(rejects({"qnet", "net.txt", "--unknown", "1"}), "unknown option");
    printf("PASS: argparse\n");
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

int
main()
{
    printf("=== IO Test ===\n");
    test_parse_network();
    test_parse_invocations();
    test_parse_errors();
    test_read_declaration_files();
    test_write_execution_log();
    test_argparse();
    return 0;
}
