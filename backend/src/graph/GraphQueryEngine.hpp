#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// One SELECT solution: variable name -> lexical value. Unbound variables are absent.
using BindingRow = std::map<std::string, std::string>;

class GraphError : public std::runtime_error {
public:
    enum class Kind { Timeout, Other };

    GraphError(Kind kind, const std::string& what)
        : std::runtime_error(what), error_kind(kind) {}

    Kind kind() const { return error_kind; }
    bool isTimeout() const { return error_kind == Kind::Timeout; }

private:
    Kind error_kind;
};

class GraphQueryEngine {
public:
    virtual ~GraphQueryEngine() = default;

    // Runs a SPARQL SELECT. Throws GraphError.
    virtual std::vector<BindingRow> select(const std::string& query) = 0;

    virtual std::string name() const = 0;
};
