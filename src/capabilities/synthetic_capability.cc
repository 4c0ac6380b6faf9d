#include "synthetic_capability.h"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "common/call_status.h"

namespace Reqflow {

namespace {

constexpr double kCriterionThreshold = 0.7;

constexpr char kClarityAtom[] =
	"Use the user story form 'As a <role>, I want <feature> so that <benefit>'";
constexpr char kTestabilityAtom[] =
	"Add acceptance criteria in Given/When/Then form";
constexpr char kMeasurabilityAtom[] =
	"Replace vague terms with measurable thresholds and units";

const std::vector<std::string>& VagueTerms() {
	static const std::vector<std::string> terms = {
		"fast", "quick", "quickly", "slow", "scalable", "good", "easy", "many", "few",
		"efficient", "flexible", "user-friendly"};
	return terms;
}

const std::vector<std::string>& UntestableTerms() {
	static const std::vector<std::string> terms = {
		"user-friendly", "intuitive", "elegant", "easy", "nice"};
	return terms;
}

const std::vector<std::string>& AcceptanceTerms() {
	static const std::vector<std::string> terms = {
		"given", "when", "then", "acceptance", "verify", "verified"};
	return terms;
}

const std::vector<std::string>& UnitTerms() {
	static const std::vector<std::string> terms = {
		"ms", "s", "seconds", "minutes", "percent", "users", "requests", "mb", "gb"};
	return terms;
}

const std::vector<std::string>& ModalTerms() {
	static const std::vector<std::string> terms = {
		"shall", "must", "should", "will", "want", "needs", "required"};
	return terms;
}

// Lower-case words; letters, digits and '-' form a word.
std::vector<std::string> Tokenize(const std::string& text) {
	std::vector<std::string> tokens;
	std::string current;
	for (char c : text) {
		unsigned char uc = static_cast<unsigned char>(c);
		if (std::isalnum(uc) || c == '-') {
			current.push_back(static_cast<char>(std::tolower(uc)));
		} else if (!current.empty()) {
			tokens.push_back(std::move(current));
			current.clear();
		}
	}
	if (!current.empty()) tokens.push_back(std::move(current));
	return tokens;
}

bool ContainsAny(const absl::flat_hash_set<std::string>& words, const std::vector<std::string>& terms) {
	for (const auto& term : terms) {
		if (words.contains(term)) return true;
	}
	return false;
}

bool HasDigit(const std::string& text) {
	return std::any_of(text.begin(), text.end(),
			[](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

// Word following `marker` in lower-cased `text`, or empty.
std::string WordAfter(const std::string& lower, const std::string& marker) {
	auto pos = lower.find(marker);
	if (pos == std::string::npos) return "";
	auto tokens = Tokenize(lower.substr(pos + marker.size()));
	return tokens.empty() ? "" : tokens.front();
}

} // namespace

SyntheticCapability::SyntheticCapability(SyntheticOptions options)
	: options_(options), rng_(options.seed) {}

absl::Status SyntheticCapability::SimulateCall(const CancellationToken& token) {
	if (options_.latency.count() > 0) {
		if (token.WaitFor(options_.latency)) return token.status();
	} else if (token.IsCancelled()) {
		return token.status();
	}
	if (options_.transient_failure_rate > 0.0) {
		double roll;
		{
			absl::MutexLock lock(&rng_mu_);
			roll = std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
		}
		if (roll < options_.transient_failure_rate) {
			return TransientCallError("synthetic capability: simulated rate limit");
		}
	}
	return absl::OkStatus();
}

Evaluation SyntheticCapability::Score(const std::string& text) {
	const auto tokens = Tokenize(text);
	const absl::flat_hash_set<std::string> words(tokens.begin(), tokens.end());
	const std::string lower = absl::AsciiStrToLower(text);

	double clarity = 0.5;
	if (absl::StrContains(lower, "as a ") || absl::StrContains(lower, "as an ")) clarity += 0.3;
	if (!ContainsAny(words, VagueTerms())) clarity += 0.2;
	if (tokens.size() >= 10 && tokens.size() <= 30) clarity += 0.1;

	double testability = 0.4;
	if (ContainsAny(words, AcceptanceTerms())) testability += 0.4;
	if (!ContainsAny(words, UntestableTerms())) testability += 0.2;

	double measurability = 0.3;
	if (HasDigit(text)) measurability += 0.3;
	if (ContainsAny(words, UnitTerms()) || absl::StrContains(text, "%")) measurability += 0.3;
	if (!ContainsAny(words, VagueTerms())) measurability += 0.1;

	Evaluation evaluation;
	evaluation.per_criterion = {
		{"clarity", std::min(1.0, clarity),
			clarity >= kCriterionThreshold ? "" : "no clear actor or vague wording"},
		{"testability", std::min(1.0, testability),
			testability >= kCriterionThreshold ? "" : "no acceptance criteria"},
		{"measurability", std::min(1.0, measurability),
			measurability >= kCriterionThreshold ? "" : "no quantified threshold"},
	};
	double sum = 0.0;
	for (const auto& criterion : evaluation.per_criterion) sum += criterion.score;
	evaluation.score = sum / static_cast<double>(evaluation.per_criterion.size());
	evaluation.verdict = evaluation.score >= kCriterionThreshold ? Verdict::Pass : Verdict::Fail;
	return evaluation;
}

double SyntheticCapability::Similarity(const std::string& a, const std::string& b) {
	const auto ta = Tokenize(a);
	const auto tb = Tokenize(b);
	const absl::flat_hash_set<std::string> wa(ta.begin(), ta.end());
	const absl::flat_hash_set<std::string> wb(tb.begin(), tb.end());
	if (wa.empty() && wb.empty()) return 0.0;
	size_t shared = 0;
	for (const auto& w : wa) {
		if (wb.contains(w)) shared++;
	}
	return static_cast<double>(shared) / static_cast<double>(wa.size() + wb.size() - shared);
}

absl::StatusOr<Evaluation> SyntheticCapability::Evaluate(const std::string& text,
		const CancellationToken& token) {
	if (absl::StripAsciiWhitespace(text).empty()) {
		return FatalCallError("cannot evaluate an empty requirement");
	}
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;
	return Score(text);
}

absl::StatusOr<std::vector<std::string>> SyntheticCapability::Suggest(const std::string& text,
		const CancellationToken& token) {
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;
	std::vector<std::string> atoms;
	for (const auto& criterion : Score(text).per_criterion) {
		if (criterion.score >= kCriterionThreshold) continue;
		if (criterion.criterion == "clarity") atoms.push_back(kClarityAtom);
		else if (criterion.criterion == "testability") atoms.push_back(kTestabilityAtom);
		else atoms.push_back(kMeasurabilityAtom);
	}
	return atoms;
}

absl::StatusOr<std::string> SyntheticCapability::Rewrite(const std::string& text,
		const std::vector<std::string>& atoms, const CancellationToken& token) {
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;

	std::string result(absl::StripAsciiWhitespace(text));
	for (const auto& atom : atoms) {
		if (atom == kMeasurabilityAtom) {
			result = absl::StrReplaceAll(result, {
				{"quickly", "within 200 ms"},
				{"fast", "within 200 ms"},
				{"scalable", "for at least 1000 concurrent users"},
			});
		} else if (atom == kClarityAtom) {
			std::string lower = absl::AsciiStrToLower(result);
			if (!absl::StrContains(lower, "as a ") && !absl::StrContains(lower, "as an ")) {
				std::string body(absl::StripSuffix(result, "."));
				if (!body.empty()) body[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(body[0])));
				result = absl::StrCat("As a user, I want ", body, " so that my goal is met.");
			}
		} else if (atom == kTestabilityAtom) {
			absl::StrAppend(&result, " Acceptance: given a valid request, when it is submitted, "
					"then the system responds within 2 seconds.");
		}
	}
	return result;
}

absl::StatusOr<std::vector<RequirementItem>> SyntheticCapability::Mine(const SourceDocument& document,
		const CancellationToken& token) {
	if (document.text.empty()) {
		return FatalCallError(absl::StrCat("document ", document.id, " is empty"));
	}
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;

	std::vector<RequirementItem> items;
	for (absl::string_view sentence : absl::StrSplit(document.text, absl::ByAnyChar(".!?\n"))) {
		std::string trimmed(absl::StripAsciiWhitespace(sentence));
		const auto tokens = Tokenize(trimmed);
		if (tokens.size() < 3) continue;
		const absl::flat_hash_set<std::string> words(tokens.begin(), tokens.end());
		if (!ContainsAny(words, ModalTerms())) continue;
		RequirementItem item;
		item.text = absl::StrCat(trimmed, ".");
		item.source_ref = document.source_ref.empty() ? document.id : document.source_ref;
		items.push_back(std::move(item));
	}
	VLOG(2) << "synthetic miner extracted " << items.size() << " requirements from " << document.id;
	return items;
}

absl::StatusOr<KnowledgeGraph> SyntheticCapability::BuildGraph(const std::vector<RequirementItem>& items,
		const CancellationToken& token) {
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;

	KnowledgeGraph graph;
	for (const auto& item : items) {
		graph.nodes.push_back({item.id, item.text.substr(0, 60), "Requirement"});
		const std::string lower = absl::AsciiStrToLower(item.text);

		std::string actor = WordAfter(lower, "as an ");
		if (actor.empty()) actor = WordAfter(lower, "as a ");
		if (!actor.empty()) {
			graph.nodes.push_back({absl::StrCat("actor:", actor), actor, "Actor"});
			graph.edges.push_back({item.id, absl::StrCat("actor:", actor), "HAS_ACTOR"});
		}

		std::string action;
		for (const char* marker : {"want to ", "shall ", "must ", "should "}) {
			action = WordAfter(lower, marker);
			if (!action.empty()) break;
		}
		if (!action.empty()) {
			graph.nodes.push_back({absl::StrCat("action:", action), action, "Action"});
			graph.edges.push_back({item.id, absl::StrCat("action:", action), "REQUIRES_ACTION"});
		}
	}
	return graph;
}

absl::StatusOr<std::vector<SearchHit>> SyntheticCapability::Search(const std::string& query,
		const std::vector<RequirementItem>& corpus, int top_k, const CancellationToken& token) {
	if (top_k < 1) {
		return FatalCallError("top_k must be positive");
	}
	absl::Status status = SimulateCall(token);
	if (!status.ok()) return status;

	std::vector<SearchHit> hits;
	hits.reserve(corpus.size());
	for (const auto& item : corpus) {
		hits.push_back({item.id, item.text, Similarity(query, item.text)});
	}
	std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
		if (a.similarity != b.similarity) return a.similarity > b.similarity;
		return a.id < b.id;
	});
	if (hits.size() > static_cast<size_t>(top_k)) hits.resize(top_k);
	return hits;
}

} // namespace Reqflow
