#include <op_mcp/mcp/resource_catalog.hpp>

#include <op_mcp/backend/domain.hpp>
#include <op_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace op_mcp {

namespace {

constexpr const char* kProjectUriPrefix = "openproject://projects/";

Error MakeUriError(const std::string& uri) {
    return Error::Make(ErrorCategory::Validation, "ResourceCatalog::Read",
                       "Unsupported resource URI: " + uri);
}

} // anonymous namespace

ResourceCatalog::ResourceCatalog(std::shared_ptr<BackendClient> client)
    : client_(std::move(client)),
      descriptors_{{"openproject://projects/{project_id}",
                    "Project Data",
                    "OpenProject data for a specific project",
                    "application/json"}} {}

Result<nlohmann::json, Error> ResourceCatalog::Read(const std::string& uri,
                                                    const CallContext& ctx) const {
    using R = Result<nlohmann::json, Error>;
    const std::string prefix = kProjectUriPrefix;
    if (uri.compare(0, prefix.size(), prefix) != 0) {
        return R::Err(MakeUriError(uri));
    }
    const auto digits = uri.substr(prefix.size());
    if (digits.empty() || digits.size() > 18 ||
        !std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return R::Err(MakeUriError(uri));
    }
    auto id = ProjectId::Create(std::stoll(digits));
    if (id.IsErr()) {
        return R::Err(MakeUriError(uri));
    }

    auto report = client_->GetWeeklyReport(id.Value(), std::nullopt, ctx.ToCallOptions());
    if (report.IsErr()) {
        return R::Err(report.Error());
    }

    const auto& r = report.Value();
    nlohmann::json packages = nlohmann::json::array();
    for (const auto& wp : r.work_packages) {
        packages.push_back(ToJson(wp));
    }
    nlohmann::json body = {
        {"project", ToJson(r.project)},
        {"work_packages", std::move(packages)},
        {"total_packages", r.work_packages.size()},
    };

    return R::Ok(nlohmann::json{
        {"contents", nlohmann::json::array({
            {{"uri", uri},
             {"mimeType", "application/json"},
             {"text", body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)}},
        })},
    });
}

nlohmann::json ToJson(const ResourceDescriptor& descriptor) {
    return {
        {"uri", descriptor.uri},
        {"name", descriptor.name},
        {"description", descriptor.description},
        {"mimeType", descriptor.mime_type},
    };
}

} // namespace op_mcp
