#pragma once

#include <QString>

namespace taskwire {
namespace data {

struct ValidationError
{
    enum Code
    {
        NoError,
        PriorityOutOfRange,
    };

    Code code = NoError;
    QString field;
    QString message;

    QString errorString() const;
};

} // namespace data
} // namespace taskwire
