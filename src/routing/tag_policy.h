#ifndef TAG_POLICY_H
#define TAG_POLICY_H

#include <json/json.h>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

enum class AclAction { ALLOW, DENY };

// One ordered ACL rule; "*" matches any tag (including none).
struct AclRule {
    std::string sourceTag;
    std::string targetTag;
    AclAction action{AclAction::DENY};

    Json::Value toJson() const;
    static std::optional<AclRule> fromJson(const Json::Value& j);
};

using PeerTags = std::map<std::string, std::set<std::string>>;

struct AclPolicySet {
    std::vector<AclRule> rules;
    PeerTags peerTags;

    Json::Value toJson() const;
    // Throws std::runtime_error on a malformed document.
    static AclPolicySet fromJson(const Json::Value& j);
    static AclPolicySet loadFile(const std::string& path);
};

// First matching rule decides. With no rules at all everything is allowed
// (development mode); otherwise an unmatched pair is denied.
bool aclAllows(const std::vector<AclRule>& rules,
               const std::set<std::string>& sourceTags,
               const std::set<std::string>& targetTags);

#endif // TAG_POLICY_H
