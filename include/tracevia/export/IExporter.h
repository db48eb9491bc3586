#pragma once

#include "../core/Types.h"

#include <ostream>
#include <string>

namespace tracevia {

class RoutingResult;

/// Abstract interface for routed-diagram exporters
class IExporter {
public:
    virtual ~IExporter() = default;

    /// Export a routed diagram to string
    virtual std::string exportToString(const RoutingInput& input, const RoutingResult& result) = 0;

    /// Export to an output stream
    virtual void exportToStream(const RoutingInput& input, const RoutingResult& result, std::ostream& out) = 0;

    /// Export to a file
    /// @return false if the file cannot be written
    virtual bool exportToFile(const RoutingInput& input, const RoutingResult& result, const std::string& filename) = 0;

    /// File extension for this format (e.g., "svg")
    virtual std::string fileExtension() const = 0;

    /// MIME type for this format (e.g., "image/svg+xml")
    virtual std::string mimeType() const = 0;
};

}  // namespace tracevia
