/**
 * @file ListMatcher.cpp
 * @brief Implementation of ListMatcher.
 */

#include "application/ListMatcher.hpp"
#include "application/ExtractionParser.hpp"
#include "infrastructure/PromptCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <iostream>
#include <set>
#include <nlohmann/json.hpp>

namespace campaignflow::application {

using domain::ContactList;
using domain::MatchedList;
using json = nlohmann::json;

namespace {

std::set<std::string> Keywords(const std::string& text) {
    static const std::set<std::string> kStopWords = {
        "the", "and", "for", "with", "who", "that", "have", "has", "are", "was", "were",
        "all", "our", "their", "from", "this", "those", "these", "list", "customers", "clients"
    };
    std::set<std::string> words;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 3 && !kStopWords.count(current)) {
            words.insert(current);
        }
        current.clear();
    };
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else {
            flush();
        }
    }
    flush();
    return words;
}

const ContactList* FindList(const std::vector<ContactList>& lists, const std::string& id) {
    auto it = std::find_if(lists.begin(), lists.end(), [&id](const ContactList& l) { return l.id == id; });
    return it == lists.end() ? nullptr : &*it;
}

std::string Label(const ContactList& list) {
    return list.displayName.empty() ? list.name : list.displayName;
}

} // namespace

ListMatcher::ListMatcher(std::shared_ptr<domain::CompletionService> completion)
    : m_completion(std::move(completion)) {}

std::vector<MatchedList> ListMatcher::rank(const std::string& audience,
                                           const std::vector<ContactList>& lists) const {
    if (lists.empty()) return {};

    if (m_completion) {
        json candidates = json::array();
        for (const auto& list : lists) {
            candidates.push_back({{"id", list.id}, {"name", Label(list)}, {"size", list.size}});
        }
        json request = {{"audience", audience}, {"lists", candidates}};

        auto raw = m_completion->complete(infrastructure::PromptCatalog::GetListRankingPrompt(), request.dump(2));
        if (raw) {
            if (auto ranked = ParseRanking(*raw, lists)) {
                return Finalize(std::move(*ranked));
            }
            std::cerr << "[ListMatcher] Ranking output unparsable, using keyword overlap" << std::endl;
        } else {
            std::cerr << "[ListMatcher] Completion unavailable, using keyword overlap" << std::endl;
        }
    }
    return Finalize(KeywordRanking(audience, lists));
}

std::optional<std::vector<MatchedList>> ListMatcher::ParseRanking(const std::string& text,
                                                                  const std::vector<ContactList>& lists) {
    auto parsed = ExtractionParser::ExtractJsonObject(text);
    if (!parsed || !parsed->contains("matches") || !(*parsed)["matches"].is_array()) {
        return std::nullopt;
    }

    std::vector<MatchedList> out;
    std::set<std::string> seen;
    for (const auto& entry : (*parsed)["matches"]) {
        if (!entry.is_object() || !entry.contains("id")) continue;

        std::string id;
        if (entry["id"].is_string()) {
            id = entry["id"].get<std::string>();
        } else if (entry["id"].is_number_integer()) {
            id = std::to_string(entry["id"].get<long long>());
        } else {
            continue;
        }
        const ContactList* list = FindList(lists, id);
        if (!list || !seen.insert(id).second) continue;

        double score = 0.0;
        if (entry.contains("score") && entry["score"].is_number()) {
            score = entry["score"].get<double>();
            if (entry["score"].is_number_float() && score > 0.0 && score <= 1.0) {
                score *= 100.0;
            }
        }
        score = std::clamp(score, 0.0, 100.0);

        MatchedList match;
        match.id = list->id;
        match.displayName = Label(*list);
        match.size = list->size;
        match.score = static_cast<int>(std::lround(score));
        if (entry.contains("reason") && entry["reason"].is_string()) {
            match.reason = entry["reason"].get<std::string>();
        }
        out.push_back(std::move(match));
    }
    return out;
}

std::vector<MatchedList> ListMatcher::KeywordRanking(const std::string& audience,
                                                     const std::vector<ContactList>& lists) {
    const auto wanted = Keywords(audience);
    std::vector<MatchedList> out;
    if (wanted.empty()) return out;

    for (const auto& list : lists) {
        auto have = Keywords(list.name + " " + list.displayName);
        std::vector<std::string> shared;
        std::set_intersection(wanted.begin(), wanted.end(), have.begin(), have.end(), std::back_inserter(shared));
        if (shared.empty()) continue;

        MatchedList match;
        match.id = list.id;
        match.displayName = Label(list);
        match.size = list.size;
        match.score = static_cast<int>(std::lround(100.0 * shared.size() / wanted.size()));
        match.reason = "Shares keywords:";
        for (std::size_t i = 0; i < shared.size(); ++i) {
            match.reason += (i == 0 ? " " : ", ") + shared[i];
        }
        out.push_back(std::move(match));
    }
    return out;
}

std::vector<MatchedList> ListMatcher::Finalize(std::vector<MatchedList> ranked) {
    ranked.erase(std::remove_if(ranked.begin(), ranked.end(),
                                [](const MatchedList& m) { return m.score <= 0; }),
                 ranked.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const MatchedList& a, const MatchedList& b) { return a.score > b.score; });
    if (ranked.size() > domain::WorkflowState::kMaxMatchedLists) {
        ranked.resize(domain::WorkflowState::kMaxMatchedLists);
    }
    return ranked;
}

} // namespace campaignflow::application
