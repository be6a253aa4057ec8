/**
 * DownloadItem.cpp
 */

#include "DownloadItem.hpp"
#include "../../utils/JsonUtils.hpp"

#include <algorithm>

namespace harbor::core::downloader {

using json = nlohmann::json;
using utils::JsonUtils;

namespace {

int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::optional<ErrorCode> parseErrorCode(const std::string& name) {
    for (auto code : {ErrorCode::AlreadyInProgress, ErrorCode::NotFound,
                      ErrorCode::InvalidTransition, ErrorCode::TransferError,
                      ErrorCode::PersistenceError, ErrorCode::PermissionDenied}) {
        if (name == errorCodeName(code)) {
            return code;
        }
    }
    return std::nullopt;
}

// Re-establish progress == 1.0 iff Completed and the failure/status pairing
void normalize(DownloadItem& item) {
    item.progress = std::clamp(item.progress, 0.0, 1.0);

    if (item.status == DownloadStatus::Completed) {
        item.progress = 1.0;
        item.failure.reset();
    } else {
        if (item.progress >= 1.0) {
            item.progress = 0.99;
        }
        if (item.status == DownloadStatus::Failed && !item.failure) {
            item.failure = TransferFailure{ErrorCode::TransferError, "Unknown failure"};
        }
        if (item.status != DownloadStatus::Failed) {
            item.failure.reset();
        }
    }
}

} // namespace

const char* statusName(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Pending:     return "pending";
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Paused:      return "paused";
        case DownloadStatus::Completed:   return "completed";
        case DownloadStatus::Failed:      return "failed";
    }
    return "pending";
}

std::optional<DownloadStatus> parseStatus(const std::string& name) {
    if (name == "pending") return DownloadStatus::Pending;
    if (name == "downloading") return DownloadStatus::Downloading;
    if (name == "paused") return DownloadStatus::Paused;
    if (name == "completed") return DownloadStatus::Completed;
    if (name == "failed") return DownloadStatus::Failed;
    return std::nullopt;
}

json DownloadItem::toJson() const {
    json j = {
        {"id", id},
        {"sourceUrl", sourceUrl},
        {"destinationPath", destinationPath},
        {"displayTitle", displayTitle},
        {"groupKey", groupKey},
        {"thumbnailUrl", thumbnailUrl},
        {"sizeBytes", sizeBytes},
        {"progress", progress},
        {"status", statusName(status)},
        {"createdAt", toEpochMillis(createdAt)},
        {"exportedToGallery", exportedToGallery}
    };

    j["resumeToken"] = resumeToken ? json(*resumeToken) : json(nullptr);

    if (failure) {
        j["failure"] = {
            {"code", errorCodeName(failure->code)},
            {"message", failure->message}
        };
    } else {
        j["failure"] = nullptr;
    }

    return j;
}

DownloadItem DownloadItem::fromJson(const json& j) {
    DownloadItem item;
    item.id = JsonUtils::getString(j, "id");
    item.sourceUrl = JsonUtils::getString(j, "sourceUrl");
    item.destinationPath = JsonUtils::getString(j, "destinationPath");
    item.displayTitle = JsonUtils::getString(j, "displayTitle");
    item.groupKey = JsonUtils::getString(j, "groupKey");
    item.thumbnailUrl = JsonUtils::getString(j, "thumbnailUrl");
    item.sizeBytes = JsonUtils::getUnsigned(j, "sizeBytes");
    item.progress = JsonUtils::getDouble(j, "progress");
    item.status = parseStatus(JsonUtils::getString(j, "status")).value_or(DownloadStatus::Failed);
    item.createdAt = fromEpochMillis(JsonUtils::getLong(j, "createdAt"));
    item.resumeToken = JsonUtils::getOptionalString(j, "resumeToken");
    item.exportedToGallery = JsonUtils::getBool(j, "exportedToGallery");

    if (j.contains("failure") && j["failure"].is_object()) {
        const auto& f = j["failure"];
        item.failure = TransferFailure{
            parseErrorCode(JsonUtils::getString(f, "code")).value_or(ErrorCode::TransferError),
            JsonUtils::getString(f, "message")
        };
    }

    normalize(item);
    return item;
}

DownloadItem DownloadItem::fromLegacyJson(const json& j) {
    DownloadItem item;
    item.id = JsonUtils::getString(j, "id");
    item.sourceUrl = JsonUtils::getStringAny(j, {"downloadUrl", "sourceUrl"});
    item.destinationPath = JsonUtils::getStringAny(j, {"filePath", "destinationPath"});
    item.displayTitle = JsonUtils::getStringAny(j, {"title", "displayTitle"});
    item.groupKey = JsonUtils::getStringAny(j, {"animeId", "groupKey"});
    item.thumbnailUrl = JsonUtils::getStringAny(j, {"thumbnail", "thumbnailUrl"});
    item.sizeBytes = JsonUtils::getUnsigned(j, "size");
    item.progress = JsonUtils::getDouble(j, "progress");
    item.status = parseStatus(JsonUtils::getString(j, "status")).value_or(DownloadStatus::Failed);
    item.createdAt = fromEpochMillis(JsonUtils::getLong(j, "dateAdded"));
    item.resumeToken = JsonUtils::getOptionalString(j, "resumeData");
    item.exportedToGallery = JsonUtils::getBool(j, "isInGallery");

    if (item.status == DownloadStatus::Failed) {
        item.failure = TransferFailure{ErrorCode::TransferError, "Failed before upgrade"};
    }

    normalize(item);
    return item;
}

} // namespace harbor::core::downloader
