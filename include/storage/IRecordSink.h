#pragma once

#include "common/Types.h"

namespace quantpulse {
namespace storage {

// Receives every record the pipeline produces. Implementations return
// false on I/O failure; the caller logs and carries on.
class IRecordSink {
public:
    virtual ~IRecordSink() = default;

    virtual bool appendWindow(const AggregatedWindow& window) = 0;
    virtual bool appendMetrics(const MetricsSnapshot& metrics) = 0;
    virtual bool appendAlert(const AlertEvent& event) = 0;
};

} // namespace storage
} // namespace quantpulse
