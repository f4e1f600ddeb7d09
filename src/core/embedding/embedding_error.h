#pragma once

#include <QString>

#include <stdexcept>

namespace ox {

class EmbeddingError : public std::runtime_error {
public:
    enum class Kind {
        Configuration,   // missing key/model; never retried
        Transient,       // 429, 5xx or network failure after all attempts
        Http,            // any other non-2xx status
        Protocol,        // malformed or inconsistent response body
    };

    EmbeddingError(Kind kind, const QString& message, int statusCode = 0)
        : std::runtime_error(message.toStdString())
        , m_kind(kind)
        , m_statusCode(statusCode)
    {
    }

    Kind kind() const { return m_kind; }
    int statusCode() const { return m_statusCode; }

    static const char* kindName(Kind kind)
    {
        switch (kind) {
        case Kind::Configuration: return "configuration";
        case Kind::Transient:     return "transient";
        case Kind::Http:          return "http";
        case Kind::Protocol:      return "protocol";
        }
        return "unknown";
    }

private:
    Kind m_kind;
    int m_statusCode;
};

} // namespace ox
