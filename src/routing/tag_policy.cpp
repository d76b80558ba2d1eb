#include "routing/tag_policy.h"
#include <fstream>
#include <stdexcept>

static bool tagMatches(const std::string& pattern, const std::set<std::string>& tags) {
    return pattern == "*" || tags.count(pattern) > 0;
}

Json::Value AclRule::toJson() const {
    Json::Value j;
    j["source"] = sourceTag;
    j["target"] = targetTag;
    j["action"] = action == AclAction::ALLOW ? "allow" : "deny";
    return j;
}

std::optional<AclRule> AclRule::fromJson(const Json::Value& j) {
    if (!j.isObject() || !j["source"].isString() || !j["target"].isString() ||
        !j["action"].isString())
        return std::nullopt;
    AclRule r;
    r.sourceTag = j["source"].asString();
    r.targetTag = j["target"].asString();
    const std::string action = j["action"].asString();
    if (action == "allow")
        r.action = AclAction::ALLOW;
    else if (action == "deny")
        r.action = AclAction::DENY;
    else
        return std::nullopt;
    return r;
}

Json::Value AclPolicySet::toJson() const {
    Json::Value j;
    j["policies"] = Json::Value(Json::arrayValue);
    for (const auto& r : rules) j["policies"].append(r.toJson());
    j["peer_tags"] = Json::Value(Json::objectValue);
    for (const auto& kv : peerTags) {
        Json::Value tags(Json::arrayValue);
        for (const auto& t : kv.second) tags.append(t);
        j["peer_tags"][kv.first] = tags;
    }
    return j;
}

AclPolicySet AclPolicySet::fromJson(const Json::Value& j) {
    AclPolicySet set;
    if (!j.isObject())
        throw std::runtime_error("ACL policy document must be a JSON object");

    const auto& policies = j["policies"];
    if (!policies.isNull() && !policies.isArray())
        throw std::runtime_error("ACL 'policies' must be an array");
    for (Json::ArrayIndex i = 0; i < policies.size(); ++i) {
        auto rule = AclRule::fromJson(policies[i]);
        if (!rule)
            throw std::runtime_error("malformed ACL rule at index " + std::to_string(i));
        set.rules.push_back(*rule);
    }

    const auto& tags = j["peer_tags"];
    if (!tags.isNull() && !tags.isObject())
        throw std::runtime_error("ACL 'peer_tags' must be an object");
    for (const auto& peer : tags.getMemberNames()) {
        const auto& list = tags[peer];
        if (!list.isArray())
            throw std::runtime_error("tags for " + peer + " must be an array");
        for (const auto& t : list) set.peerTags[peer].insert(t.asString());
    }
    return set;
}

AclPolicySet AclPolicySet::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good())
        throw std::runtime_error("cannot open ACL policy file " + path);
    Json::Value j;
    Json::CharReaderBuilder reader;
    std::string errs;
    if (!Json::parseFromStream(reader, in, &j, &errs))
        throw std::runtime_error("invalid ACL policy JSON in " + path + ": " + errs);
    return fromJson(j);
}

bool aclAllows(const std::vector<AclRule>& rules, const std::set<std::string>& sourceTags,
               const std::set<std::string>& targetTags) {
    if (rules.empty())
        return true;
    for (const auto& r : rules) {
        if (tagMatches(r.sourceTag, sourceTags) && tagMatches(r.targetTag, targetTags))
            return r.action == AclAction::ALLOW;
    }
    return false;
}
