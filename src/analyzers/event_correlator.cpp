/**
 * @file event_correlator.cpp
 * @brief Implementation of the cross-event correlation pass
 *
 * Single O(n) grouping pass. Groups keep first-appearance order through an
 * index map into a vector of buckets.
 *
 * @date 2025
 */

#include "auditlens/analyzers/event_correlator.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace auditlens {
namespace analyzers {

using json = nlohmann::json;

namespace {

struct UserBucket {
    std::string user;
    std::size_t event_count{0};
};

struct IpBucket {
    std::string ip_address;
    std::size_t event_count{0};
    DistinctValues users;
};

} // anonymous namespace

std::size_t EventCorrelator::Correlate(const std::vector<NormalizedEvent>& events,
                                       RunContext& context) const {
    const auto& thresholds = context.Config().Thresholds();

    std::vector<UserBucket> user_buckets;
    std::unordered_map<std::string, std::size_t> user_index;
    std::vector<IpBucket> ip_buckets;
    std::unordered_map<std::string, std::size_t> ip_index;

    for (const auto& event : events) {
        const std::string user = event.UserName();

        auto [user_it, user_inserted] = user_index.emplace(user, user_buckets.size());
        if (user_inserted) {
            user_buckets.push_back(UserBucket{user, 0});
        }
        ++user_buckets[user_it->second].event_count;

        if (event.ip_address == kUnknown) {
            continue;
        }

        auto [ip_it, ip_inserted] = ip_index.emplace(event.ip_address, ip_buckets.size());
        if (ip_inserted) {
            IpBucket bucket;
            bucket.ip_address = event.ip_address;
            ip_buckets.push_back(std::move(bucket));
        }
        auto& bucket = ip_buckets[ip_it->second];
        ++bucket.event_count;
        bucket.users.Insert(user);
    }

    std::size_t added = 0;

    // Detect anomalous user volume
    for (const auto& bucket : user_buckets) {
        if (bucket.event_count <= thresholds.high_activity_events) {
            continue;
        }

        Finding finding;
        finding.title = "Unusually High User Activity";
        finding.severity = Severity::MEDIUM;
        finding.description = "User " + bucket.user + " performed " +
                              std::to_string(bucket.event_count) +
                              " activities - unusually high volume";
        finding.timestamp = context.AnalysisTime();
        finding.type = "high_activity_user";
        finding.category = "behavioral";
        finding.affected_entities.users = {bucket.user};
        finding.evidence = {
            {"activityCount", bucket.event_count},
            {"timespan", "Analysis period"}
        };
        finding.mitre_mapping = context.Catalog().MappingFor(finding.type);
        finding.recommendations = context.Catalog().RecommendationsFor(finding.type);

        spdlog::debug("High activity user: {} ({} events)", bucket.user, bucket.event_count);
        context.AddFinding(std::move(finding));
        ++added;
    }

    // Detect IP addresses shared by many users
    for (const auto& bucket : ip_buckets) {
        if (bucket.event_count <= thresholds.shared_ip_events ||
            bucket.users.Size() <= thresholds.shared_ip_users) {
            continue;
        }

        Finding finding;
        finding.title = "Multiple Users from Same IP";
        finding.severity = Severity::HIGH;
        finding.description = "IP " + bucket.ip_address + " used by " +
                              std::to_string(bucket.users.Size()) +
                              " different users - potential shared/compromised connection";
        finding.timestamp = context.AnalysisTime();
        finding.type = "shared_ip_access";
        finding.category = "security";
        finding.affected_entities.ip_addresses = {bucket.ip_address};
        finding.affected_entities.users = bucket.users.Values();
        finding.evidence = {
            {"ipAddress", bucket.ip_address},
            {"userCount", bucket.users.Size()},
            {"activityCount", bucket.event_count}
        };
        finding.mitre_mapping = context.Catalog().MappingFor(finding.type);
        finding.recommendations = context.Catalog().RecommendationsFor(finding.type);

        spdlog::debug("Shared IP: {} ({} users, {} events)",
                      bucket.ip_address, bucket.users.Size(), bucket.event_count);
        context.AddFinding(std::move(finding));
        ++added;
    }

    return added;
}

} // namespace analyzers
} // namespace auditlens
