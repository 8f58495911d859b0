#pragma once

#include <string>

namespace tusgate {

/// Per-request identity handed explicitly to every bridge operation.
struct RequestContext {
    std::string tenant_id;   // selects the bucket and prefixes object keys
    std::string principal;   // recorded as the object's creator
    std::string request_id;
};

}  // namespace tusgate
