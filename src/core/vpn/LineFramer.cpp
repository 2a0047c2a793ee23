#include "LineFramer.hpp"

namespace pyro {

QList<QByteArray> LineFramer::feed(const QByteArray& data)
{
    QList<QByteArray> lines;
    if (data.isEmpty())
        return lines;

    buffer_ += data;

    qsizetype start = 0;
    while (true) {
        const qsizetype idx = buffer_.indexOf('\n', start);
        if (idx < 0) break;

        QByteArray line = buffer_.mid(start, idx - start);
        if (line.endsWith('\r'))
            line.chop(1);
        lines.append(line);
        start = idx + 1;
    }

    if (start > 0)
        buffer_.remove(0, start);

    return lines;
}

} // namespace pyro
