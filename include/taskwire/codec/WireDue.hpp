#pragma once

#include <QString>
#include <optional>
#include <variant>

#include "taskwire/data/Due.hpp"

namespace taskwire {
namespace codec {

constexpr const char *DueLanguage = "en";

struct NoDue
{
};

struct DueString
{
    QString string;
    QString language;
};

struct DueDate
{
    QString date;
};

struct DueDateTime
{
    QString datetime;
};

// The single due representation sent on write, chosen by specificity:
// datetime, then date, then the human string. NoDue emits nothing.
using WireDue = std::variant<NoDue, DueString, DueDate, DueDateTime>;

WireDue resolveWireDue(const std::optional<data::Due> &due);

} // namespace codec
} // namespace taskwire
