#pragma once

#include <QString>

namespace taskwire {
namespace codec {

struct DeserializationError
{
    enum Code
    {
        NoError,
        MalformedJson,
        NotAnObject,
        MissingField,
        TypeMismatch,
        OutOfRange,
    };

    Code code = NoError;
    QString field; // dotted path, e.g. "due.string" or "label_ids[2]"
    QString message;

    QString errorString() const;
};

} // namespace codec
} // namespace taskwire
