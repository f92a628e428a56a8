/*
 *  author: qnet developers
 *  date:   18 October 2026
 * */

#include "qnet/io.h"
#include "generic_io.h"

#include <iomanip>
#include <sstream>

namespace qnet
{

namespace
{

class LINE_PARSER
{
public:
    const size_t lineno;
private:
    std::vector<std::string> tokens_;
public:
    LINE_PARSER(size_t _lineno, const std::string& line)
        :lineno(_lineno)
    {
        std::string body = line.substr(0, line.find('#'));
        std::istringstream strm(body);
        std::string t;
        while (strm >> t)
            tokens_.push_back(t);
    }

    bool   empty() const { return tokens_.empty(); }
    size_t size() const { return tokens_.size(); }

    const std::string& at(size_t i) const
    {
        if (i >= tokens_.size())
            fail("missing argument " + std::to_string(i) + " for `" + tokens_[0] + "`");
        return tokens_[i];
    }

    [[noreturn]] void
    fail(const std::string& msg) const
    {
        throw_configuration_error("read_declaration: line " + std::to_string(lineno) + ": " + msg);
    }

    double
    to_double(const std::string& s) const
    {
        try
        {
            size_t pos;
            double x = std::stod(s, &pos);
            if (pos != s.size())
                fail("not a number -- " + s);
            return x;
        }
        catch (const std::invalid_argument&)
        {
            fail("not a number -- " + s);
        }
        catch (const std::out_of_range&)
        {
            fail("number out of range -- " + s);
        }
    }

    int64_t
    to_int(const std::string& s) const
    {
        try
        {
            size_t pos;
            int64_t x = std::stoll(s, &pos);
            if (pos != s.size())
                fail("not an integer -- " + s);
            return x;
        }
        catch (const std::invalid_argument&)
        {
            fail("not an integer -- " + s);
        }
        catch (const std::out_of_range&)
        {
            fail("integer out of range -- " + s);
        }
    }

    size_t
    to_count(const std::string& s) const
    {
        int64_t x = to_int(s);
        if (x < 0)
            fail("expected a non-negative count -- " + s);
        return static_cast<size_t>(x);
    }

    /*
     * Splits `key=value`. Returns false if `t` has no '='.
     * */
    static bool
    split_option(const std::string& t, std::string& key, std::string& value)
    {
        size_t eq = t.find('=');
        if (eq == std::string::npos)
            return false;
        key = t.substr(0, eq);
        value = t.substr(eq+1);
        return true;
    }
};

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

POSITION
parse_position(const LINE_PARSER& p, const std::string& s)
{
    std::vector<double> xyz;
    std::string t;
    std::istringstream strm(s);
    while (std::getline(strm, t, ','))
        xyz.push_back(p.to_double(t));
    if (xyz.size() != 3)
        p.fail("position must be x,y,z -- " + s);
    return POSITION{xyz[0], xyz[1], xyz[2]};
}

NODE_SPEC
parse_node(const LINE_PARSER& p)
{
    NODE_SPEC n;
    n.id = p.at(1);
    n.kind = node_kind_from_string(p.at(2));
    n.qubit_count = p.to_int(p.at(3));
    for (size_t i = 4; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value))
            p.fail("expected key=value -- " + p.at(i));

        if (key == "memory")
        {
            if (!n.memory.has_value())
                n.memory = MEMORY_SPEC{};
            n.memory->capacity = p.to_int(value);
        }
        else if (key == "coherence")
        {
            if (!n.memory.has_value())
                n.memory = MEMORY_SPEC{};
            n.memory->coherence_time_ns = p.to_double(value);
        }
        else if (key == "pos")
        {
            n.position = parse_position(p, value);
        }
        else
        {
            p.fail("unknown node option -- " + key);
        }
    }
    return n;
}

LINK_SPEC
parse_link(const LINE_PARSER& p)
{
    LINK_SPEC l;
    l.source = p.at(1);
    l.target = p.at(2);
    for (size_t i = 3; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value))
            p.fail("expected key=value -- " + p.at(i));

        if (key == "distance")
            l.distance = p.to_double(value);
        else if (key == "loss")
            l.loss_rate = p.to_double(value);
        else
            p.fail("unknown link option -- " + key);
    }
    return l;
}

CHANNEL_SPEC
parse_channel(const LINE_PARSER& p)
{
    CHANNEL_SPEC c;
    c.id = p.at(1);
    for (size_t i = 2; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value))
            p.fail("expected key=value -- " + p.at(i));

        if (key == "capacity")
            c.capacity = p.to_int(value);
        else if (key == "fidelity")
            c.fidelity = p.to_double(value);
        else if (key == "bandwidth")
            c.bandwidth = p.to_double(value);
        else
            p.fail("unknown channel option -- " + key);
    }
    return c;
}

PROTOCOL_INVOCATION
parse_teleport(const LINE_PARSER& p)
{
    TELEPORT_REQUEST req{.source=p.at(1), .target=p.at(2), .qubit=p.at(3)};
    for (size_t i = 4; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value) || key != "pair")
            p.fail("unknown teleport option -- " + p.at(i));
        req.pair = value;
    }
    return req;
}

PROTOCOL_INVOCATION
parse_entangle(const LINE_PARSER& p)
{
    ENTANGLE_REQUEST req;
    req.kind = entanglement_kind_from_string(p.at(1));
    req.fidelity_threshold = p.to_double(p.at(2));
    for (size_t i = 3; i < p.size(); i++)
    {
        if (p.at(i) == "purify")
            req.purify = true;
        else
            req.nodes.push_back(p.at(i));
    }
    return req;
}

PROTOCOL_INVOCATION
parse_purify(const LINE_PARSER& p)
{
    PURIFY_REQUEST req;
    req.target_fidelity = p.to_double(p.at(1));
    req.rounds = p.to_count(p.at(2));
    for (size_t i = 3; i < p.size(); i++)
        req.pairs.push_back(p.at(i));
    return req;
}

PROTOCOL_INVOCATION
parse_swap(const LINE_PARSER& p)
{
    SWAP_REQUEST req{.qubit_a=p.at(1), .qubit_b=p.at(2)};
    if (p.size() > 4)
        p.fail("too many arguments for `swap`");
    if (p.size() == 4)
    {
        if (p.at(3) != "nomeasure")
            p.fail("unknown swap option -- " + p.at(3));
        req.measure = false;
    }
    return req;
}

bit_vector_type
parse_bits(const LINE_PARSER& p, const std::string& s)
{
    bit_vector_type bits;
    for (char c : s)
    {
        if (c != '0' && c != '1')
            p.fail("expected a bit string -- " + s);
        bits.push_back(c == '1');
    }
    return bits;
}

PROTOCOL_INVOCATION
parse_superdense(const LINE_PARSER& p)
{
    SUPERDENSE_REQUEST req{.sender=p.at(1), .receiver=p.at(2)};
    bit_vector_type bits = parse_bits(p, p.at(3));
    if (bits.size() != 2)
        p.fail("superdense carries exactly two bits -- " + p.at(3));
    req.bits = {bits[0], bits[1]};
    for (size_t i = 4; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value) || key != "pair")
            p.fail("unknown superdense option -- " + p.at(i));
        req.pair = value;
    }
    return req;
}

PROTOCOL_INVOCATION
parse_send(const LINE_PARSER& p)
{
    SEND_REQUEST req{.source=p.at(1), .destination=p.at(2), .bits=parse_bits(p, p.at(3))};
    for (size_t i = 4; i < p.size(); i++)
    {
        std::string key, value;
        if (!LINE_PARSER::split_option(p.at(i), key, value) || key != "channel")
            p.fail("unknown send option -- " + p.at(i));
        req.channel = value;
    }
    return req;
}

}  // anon

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

DECLARATION
parse_declaration(const std::vector<std::string>& lines)
{
    DECLARATION decl;
    decl.network.name = "network";

    bool seen_network{false};
    for (size_t i = 0; i < lines.size(); i++)
    {
        LINE_PARSER p(i+1, lines[i]);
        if (p.empty())
            continue;

        const std::string& cmd = p.at(0);
        try
        {
            if (cmd == "network")
            {
                if (seen_network)
                    p.fail("network declared twice");
                seen_network = true;
                decl.network.name = p.at(1);
                decl.network.topology = p.at(2);
            }
            else if (cmd == "node")
            {
                decl.network.nodes.push_back(parse_node(p));
            }
            else if (cmd == "link")
            {
                decl.network.links.push_back(parse_link(p));
            }
            else if (cmd == "channel")
            {
                if (decl.network.links.empty())
                    p.fail("channel declared before any link");
                decl.network.links.back().channels.push_back(parse_channel(p));
            }
            else if (cmd == "bb84")
            {
                decl.invocations.push_back(BB84_REQUEST{
                                            .alice=p.at(1),
                                            .bob=p.at(2),
                                            .key_length=p.to_count(p.at(3)),
                                            .security_threshold=p.to_double(p.at(4))
                                        });
            }
            else if (cmd == "e91")
            {
                decl.invocations.push_back(E91_REQUEST{
                                            .alice=p.at(1),
                                            .bob=p.at(2),
                                            .key_length=p.to_count(p.at(3))
                                        });
            }
            else if (cmd == "teleport")
            {
                decl.invocations.push_back(parse_teleport(p));
            }
            else if (cmd == "entangle")
            {
                decl.invocations.push_back(parse_entangle(p));
            }
            else if (cmd == "purify")
            {
                decl.invocations.push_back(parse_purify(p));
            }
            else if (cmd == "swap")
            {
                decl.invocations.push_back(parse_swap(p));
            }
            else if (cmd == "superdense")
            {
                decl.invocations.push_back(parse_superdense(p));
            }
            else if (cmd == "send")
            {
                decl.invocations.push_back(parse_send(p));
            }
            else
            {
                p.fail("unknown declaration -- " + cmd);
            }
        }
        catch (const NETWORK_ERROR& e)
        {
            // errors from the enum parsers do not know the line yet
            std::string msg = e.what();
            if (msg.find("read_declaration: line") == std::string::npos)
                p.fail(msg);
            throw;
        }
    }
    return decl;
}

DECLARATION
read_declaration(std::string path)
{
    generic_strm_type strm;
    try
    {
        generic_strm_open(strm, path, "r");
    }
    catch (const std::runtime_error& e)
    {
        throw_configuration_error("read_declaration: " + std::string{e.what()});
    }

    std::vector<std::string> lines;
    std::string line;
    try
    {
        while (generic_strm_getline(strm, line))
            lines.push_back(line);
    }
    catch (const std::runtime_error& e)
    {
        generic_strm_close(strm);
        throw_configuration_error("read_declaration: " + path + ": " + e.what());
    }
    generic_strm_close(strm);

    return parse_declaration(lines);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

std::string
format_log_entry(const EXECUTION_LOG_ENTRY& e)
{
    std::ostringstream strm;
    strm << "#" << std::setw(4) << std::left << e.index
        << " " << std::setw(10) << std::left << e.protocol
        << " " << std::fixed << std::setprecision(3) << e.walltime_ms << "ms"
        << " " << e.summary;
    return strm.str();
}

void
write_execution_log(std::string path, const std::vector<EXECUTION_LOG_ENTRY>& entries)
{
    generic_strm_type strm;
    try
    {
        generic_strm_open(strm, path, "w");
    }
    catch (const std::runtime_error& e)
    {
        throw_configuration_error("write_execution_log: " + std::string{e.what()});
    }

    try
    {
        for (const auto& e : entries)
            generic_strm_write(strm, format_log_entry(e) + "\n");
    }
    catch (const std::runtime_error& e)
    {
        generic_strm_close(strm);
        throw_resource_error("write_execution_log: " + path + ": " + e.what());
    }
    generic_strm_close(strm);
}

////////////////////////////////////////////////////////////
////////////////////////////////////////////////////////////

}  // namespace qnet
