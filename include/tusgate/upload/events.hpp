#pragma once

#include "tusgate/core/context.hpp"
#include "tusgate/core/log.hpp"

#include <string>

namespace tusgate {

// Notified when an upload session starts and when its object is committed.
// Fire-and-forget: a throwing sink is logged and ignored.
class UploadEventSink {
public:
    virtual ~UploadEventSink() = default;
    virtual void on_upload_initiated(const RequestContext& ctx, const std::string& slot_id) = 0;
    virtual void on_upload_finalized(const RequestContext& ctx, const std::string& slot_id) = 0;
};

class LoggingEventSink : public UploadEventSink {
public:
    void on_upload_initiated(const RequestContext& ctx, const std::string& slot_id) override {
        log_info("upload initiated: slot=%s tenant=%s request=%s", slot_id.c_str(),
                 ctx.tenant_id.c_str(), ctx.request_id.c_str());
    }

    void on_upload_finalized(const RequestContext& ctx, const std::string& slot_id) override {
        log_info("upload finalized: slot=%s tenant=%s request=%s", slot_id.c_str(),
                 ctx.tenant_id.c_str(), ctx.request_id.c_str());
    }
};

} // namespace tusgate
