#pragma once

#include <op_mcp/backend/backend_client.hpp>
#include <op_mcp/core/result.hpp>
#include <op_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace op_mcp {

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

// ---------------------------------------------------------------------------
// ResourceCatalog: the static resource list plus reads of
// "openproject://projects/<id>".
// ---------------------------------------------------------------------------
class ResourceCatalog {
public:
    explicit ResourceCatalog(std::shared_ptr<BackendClient> client);

    [[nodiscard]] const std::vector<ResourceDescriptor>& List() const noexcept {
        return descriptors_;
    }

    // {"contents":[{"uri", "mimeType", "text"}]} where text is the project,
    // its work packages and total_packages as JSON.
    [[nodiscard]] Result<nlohmann::json, Error> Read(const std::string& uri,
                                                     const CallContext& ctx) const;

private:
    std::shared_ptr<BackendClient> client_;
    std::vector<ResourceDescriptor> descriptors_;
};

nlohmann::json ToJson(const ResourceDescriptor& descriptor);

} // namespace op_mcp
