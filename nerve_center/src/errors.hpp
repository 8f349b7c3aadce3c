#pragma once

#include <stdexcept>
#include <string>
#include <vector>

// Rejected request input; surfaced as HTTP 400
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message,
                             std::vector<std::string> missing_fields = {})
        : std::runtime_error(message), missing_fields_(std::move(missing_fields)) {}

    const std::vector<std::string>& missing_fields() const { return missing_fields_; }

private:
    std::vector<std::string> missing_fields_;
};

// Unknown agent or event; surfaced as HTTP 404
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};
