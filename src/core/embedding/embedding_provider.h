#pragma once

#include <QString>

#include <stdexcept>
#include <vector>

namespace dr {

class EmbeddingProviderError : public std::runtime_error {
public:
    enum class Kind {
        Transient,  // timeout, connection failure, rate limit, server error
        Permanent,  // authentication, validation, malformed request
    };

    EmbeddingProviderError(Kind kind, const QString& message)
        : std::runtime_error(message.toStdString())
        , m_kind(kind)
    {
    }

    Kind kind() const { return m_kind; }
    bool isTransient() const { return m_kind == Kind::Transient; }

private:
    Kind m_kind;
};

// Remote or local model that turns texts into vectors.
// embed() returns one vector per input, in input order, or throws
// EmbeddingProviderError.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual QString modelId() const = 0;
    virtual std::vector<std::vector<float>> embed(const std::vector<QString>& texts) = 0;
};

} // namespace dr
