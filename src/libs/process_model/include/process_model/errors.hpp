#pragma once

#include <stdexcept>
#include <string>

namespace process_model {

class ProcessError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed construction or import input. No partial graph is ever produced.
class ValidationError : public ProcessError {
public:
    using ProcessError::ProcessError;
};

class UnknownNodeError : public ProcessError {
public:
    explicit UnknownNodeError(const std::string& node_id)
        : ProcessError("unknown node id '" + node_id + "'"), node_id_(node_id) {}

    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

// Raised by the critical path calculator when no start->end path exists.
class NoPathError : public ProcessError {
public:
    explicit NoPathError(const std::string& process_id)
        : ProcessError("no start-to-end path in process '" + process_id + "'"), process_id_(process_id) {}

    const std::string& process_id() const { return process_id_; }

private:
    std::string process_id_;
};

class NotFoundError : public ProcessError {
public:
    explicit NotFoundError(const std::string& process_id)
        : ProcessError("process '" + process_id + "' not found"), process_id_(process_id) {}

    const std::string& process_id() const { return process_id_; }

private:
    std::string process_id_;
};

} // namespace process_model
