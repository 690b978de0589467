#ifndef EXCEPTIONS_HPP
#define EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace prodintel {

/**
 * @brief Base class for all errors raised by the production intelligence engine
 *
 * Carries the name of the component that raised the error so log lines and
 * CLI messages can point at the failing stage.
 */
class ProdIntelException : public std::runtime_error {
public:
    ProdIntelException(const std::string& component, const std::string& message)
        : std::runtime_error(component + ": " + message),
          component_(component),
          message_(message) {}

    const std::string& getComponent() const { return component_; }
    const std::string& getMessage() const { return message_; }

private:
    std::string component_;
    std::string message_;
};

/**
 * @brief A source row could not be turned into a valid record
 *        (malformed date, non-numeric field, negative counter, empty operator name).
 */
class InvalidRecordException : public ProdIntelException {
public:
    using ProdIntelException::ProdIntelException;
};

/**
 * @brief Input file structure is unusable (missing columns, empty header).
 */
class DataFormatException : public ProdIntelException {
public:
    using ProdIntelException::ProdIntelException;
};

/**
 * @brief A configuration value or request parameter is out of its valid domain.
 */
class InvalidParameterException : public ProdIntelException {
public:
    using ProdIntelException::ProdIntelException;
};

class FileIOException : public ProdIntelException {
public:
    using ProdIntelException::ProdIntelException;
};

} // namespace prodintel

#define PRODINTEL_THROW_INVALID_PARAM(component, message) \
    throw ::prodintel::InvalidParameterException((component), (message))

#define PRODINTEL_THROW_DATA_FORMAT(component, message) \
    throw ::prodintel::DataFormatException((component), (message))

#endif // EXCEPTIONS_HPP
