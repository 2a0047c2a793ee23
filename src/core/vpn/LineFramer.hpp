#pragma once

#include <QByteArray>
#include <QList>

namespace pyro {

/// Splits a byte stream into newline-terminated lines.
/// The buffer only ever holds the trailing partial line, so the result
/// does not depend on how the stream was chunked.
class LineFramer {
public:
    /// Append a chunk and return every line it completed, in order,
    /// without the '\n' and without a trailing '\r'.
    QList<QByteArray> feed(const QByteArray& data);

    /// Bytes received after the last newline.
    const QByteArray& pending() const { return buffer_; }

    void clear() { buffer_.clear(); }

private:
    QByteArray buffer_;
};

} // namespace pyro
