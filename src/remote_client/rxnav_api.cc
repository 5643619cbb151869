#include "rxnav_api.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include <glog/logging.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include "common/errors.h"
#include "remote_client.h"

namespace Rxcache {

const char* const kStatusActive = "ACTIVE";
const char* const kStatusRetired = "RETIRED";
const char* const kStatusNeverActive = "NEVER%20ACTIVE";
const char* const kStatusNonRxnorm = "NON-RXNORM";

namespace {

// Member of an object, nullptr when v is not an object or lacks it
const Json::Value* Member(const Json::Value& v, const char* name) {
	if (!v.isObject()) return nullptr;
	return v.find(name, name + strlen(name));
}

std::string TextMember(const Json::Value& v, const char* name) {
	const Json::Value* m = Member(v, name);
	if (m == nullptr || m->isNull()) return "";
	if (!m->isString()) {
		throw PayloadFormatError(absl::StrCat("Field '", name, "' is not text"));
	}
	return m->asString();
}

// RxNav sends codes as decimal strings
int64_t ParseCode(const Json::Value& v, const char* what) {
	if (v.isIntegral()) {
		return v.asInt64();
	}
	int64_t code;
	if (!v.isString() || !absl::SimpleAtoi(v.asString(), &code)) {
		throw PayloadFormatError(absl::StrCat("Malformed ", what, " [", v.toStyledString(), "]"));
	}
	return code;
}

// Absent, null and "" all mean no code
bool HasCode(const Json::Value* v) {
	if (v == nullptr || v->isNull()) return false;
	return !(v->isString() && v->asString().empty());
}

void CollectLeaves(const Json::Value& nodes, absl::btree_set<std::string>& leaves) {
	if (!nodes.isArray()) return;
	for (const Json::Value& node : nodes) {
		const Json::Value* item = Member(node, "rxclassMinConceptItem");
		const Json::Value* children = Member(node, "rxclassTree");
		bool has_children = children != nullptr && children->isArray() && !children->empty();
		if (has_children) {
			CollectLeaves(*children, leaves);
		} else if (item != nullptr) {
			std::string id = TextMember(*item, "classId");
			if (!id.empty()) leaves.insert(id);
		}
	}
}

} // namespace

HistoryField ParseHistoryField(const std::string& name) {
	if (name == "NAME") return HistoryField::kName;
	if (name == "TTY") return HistoryField::kTty;
	if (name == "STATUS") return HistoryField::kStatus;
	if (name == "START") return HistoryField::kStart;
	if (name == "END") return HistoryField::kEnd;
	if (name == "SCDRXCUI") return HistoryField::kScdRxcui;
	if (name == "BOSSRXCUIS") return HistoryField::kBossRxcuis;
	throw std::invalid_argument("Invalid history attribute [" + name + "]");
}

const char* HistoryFieldName(HistoryField field) {
	switch (field) {
		case HistoryField::kName: return "NAME";
		case HistoryField::kTty: return "TTY";
		case HistoryField::kStatus: return "STATUS";
		case HistoryField::kStart: return "START";
		case HistoryField::kEnd: return "END";
		case HistoryField::kScdRxcui: return "SCDRXCUI";
		case HistoryField::kBossRxcuis: return "BOSSRXCUIS";
	}
	return "UNKNOWN";
}

TtyCategory CategoryForTty(const std::string& tty) {
	if (tty == "IN" || tty == "MIN" || tty == "PIN") {
		return TtyCategory::kIngredient;
	}
	if (tty == "SCD" || tty == "SBD" || tty == "GPCK" || tty == "BPCK") {
		return TtyCategory::kDrug;
	}
	return TtyCategory::kOther;
}

const char* TtyCategoryName(TtyCategory category) {
	switch (category) {
		case TtyCategory::kIngredient: return "INGREDIENT";
		case TtyCategory::kDrug: return "DRUG";
		case TtyCategory::kOther: return "OTHER";
	}
	return "OTHER";
}

const std::vector<std::string>& ValidStatusValues() {
	static const std::vector<std::string> values = {
		kStatusActive, kStatusRetired, kStatusNonRxnorm, kStatusNeverActive};
	return values;
}

RxNavApi::RxNavApi(RemoteClient* client, std::string base_url)
	: client_(client), base_url_(std::move(base_url)) {
	while (!base_url_.empty() && base_url_.back() == '/') {
		base_url_.pop_back();
	}
}

std::string RxNavApi::AllRelatedKey(int64_t code) const {
	return absl::StrCat(base_url_, "/rxcui/", code, "/allrelated.json");
}

std::string RxNavApi::HistoryKey(int64_t code) const {
	return absl::StrCat(base_url_, "/rxcuihistory/concept.json?rxcui=", code);
}

std::string RxNavApi::NdcKey(int64_t code) const {
	return absl::StrCat(base_url_, "/rxcui/", code, "/allhistoricalndcs/json");
}

std::string RxNavApi::ClassTreeKey(const std::string& class_id) const {
	return absl::StrCat(base_url_, "/rxclass/classTree/json?classId=", class_id);
}

std::string RxNavApi::ClassMembersKey(const std::string& class_id) const {
	return absl::StrCat(base_url_, "/rxclass/classMembers.json?classId=", class_id,
			"&relaSource=VA&rela=has_VAClass&ttys=SCD+GPCK");
}

std::string RxNavApi::StatusKey(const std::string& status) const {
	return absl::StrCat(base_url_, "/rxcuihistory/status.json?type=", status);
}

Json::Value RxNavApi::AllRelated(int64_t code) {
	return client_->Fetch(AllRelatedKey(code));
}

Json::Value RxNavApi::HistoricalConcept(int64_t code) {
	return client_->Fetch(HistoryKey(code));
}

std::optional<std::vector<HistoryValue>> RxNavApi::HistoricalAttributes(int64_t code,
		const std::vector<HistoryField>& fields) {
	Json::Value d = HistoricalConcept(code);
	const Json::Value* history = Member(d, "rxcuiHistoryConcept");
	const Json::Value* concept_block = history ? Member(*history, "rxcuiConcept") : nullptr;
	if (concept_block == nullptr || !concept_block->isObject()) {
		return std::nullopt;
	}

	std::vector<HistoryValue> result;
	result.reserve(fields.size());
	for (HistoryField field : fields) {
		switch (field) {
			case HistoryField::kName:
				result.emplace_back(TextMember(*concept_block, "str"));
				break;
			case HistoryField::kTty:
				result.emplace_back(TextMember(*concept_block, "tty"));
				break;
			case HistoryField::kStatus:
				result.emplace_back(TextMember(*concept_block, "status"));
				break;
			case HistoryField::kStart:
				result.emplace_back(TextMember(*concept_block, "startDate"));
				break;
			case HistoryField::kEnd:
				result.emplace_back(TextMember(*concept_block, "endDate"));
				break;
			case HistoryField::kScdRxcui: {
				const Json::Value* scd = Member(*concept_block, "scdRxcui");
				std::optional<int64_t> value;
				if (HasCode(scd)) {
					value = ParseCode(*scd, "scdRxcui");
				}
				result.emplace_back(value);
				break;
			}
			case HistoryField::kBossRxcuis: {
				std::vector<int64_t> boss_codes;
				const Json::Value* boss = Member(*history, "bossConcept");
				if (boss != nullptr && boss->isArray()) {
					for (const Json::Value& b : *boss) {
						const Json::Value* rxcui = Member(b, "bossRxcui");
						if (HasCode(rxcui)) {
							boss_codes.push_back(ParseCode(*rxcui, "bossRxcui"));
						}
					}
				}
				result.emplace_back(std::move(boss_codes));
				break;
			}
		}
	}
	return result;
}

std::string RxNavApi::HistoryTty(int64_t code) {
	auto attrs = HistoricalAttributes(code, {HistoryField::kTty});
	if (!attrs) return "";
	return std::get<std::string>((*attrs)[0]);
}

absl::btree_set<std::string> RxNavApi::NdcCodesFor(int64_t code) {
	Json::Value d = client_->Fetch(NdcKey(code));
	absl::btree_set<std::string> ndcs;

	const Json::Value* concept_block = Member(d, "historicalNdcConcept");
	const Json::Value* times = concept_block ? Member(*concept_block, "historicalNdcTime") : nullptr;
	if (times == nullptr || !times->isArray()) {
		return ndcs;
	}
	for (const Json::Value& time : *times) {
		const Json::Value* ndc_times = Member(time, "ndcTime");
		if (ndc_times == nullptr || !ndc_times->isArray()) continue;
		for (const Json::Value& ndc_time : *ndc_times) {
			const Json::Value* ndc = Member(ndc_time, "ndc");
			if (ndc == nullptr) continue;
			if (ndc->isArray()) {
				for (const Json::Value& n : *ndc) {
					if (n.isString()) ndcs.insert(n.asString());
				}
			} else if (ndc->isString()) {
				ndcs.insert(ndc->asString());
			}
		}
	}
	return ndcs;
}

Json::Value RxNavApi::ClassTree(const std::string& root_class_id) {
	return client_->Fetch(ClassTreeKey(root_class_id));
}

std::vector<int64_t> RxNavApi::GenericDrugsForVaClass(const std::string& class_id) {
	Json::Value d = client_->Fetch(ClassMembersKey(class_id));
	std::vector<int64_t> codes;

	const Json::Value* group = Member(d, "drugMemberGroup");
	const Json::Value* members = group ? Member(*group, "drugMember") : nullptr;
	if (members == nullptr || !members->isArray()) {
		return codes;
	}
	for (const Json::Value& member : *members) {
		const Json::Value* min_concept = Member(member, "minConcept");
		const Json::Value* rxcui = min_concept ? Member(*min_concept, "rxcui") : nullptr;
		if (rxcui == nullptr) {
			throw PayloadFormatError("classMembers entry without minConcept.rxcui for class " + class_id);
		}
		codes.push_back(ParseCode(*rxcui, "class member rxcui"));
	}
	return codes;
}

StatusEnumeration RxNavApi::CodesWithStatuses(const std::vector<std::string>& statuses, bool verbose) {
	const auto& valid = ValidStatusValues();
	for (const auto& status : statuses) {
		if (std::find(valid.begin(), valid.end(), status) == valid.end()) {
			throw std::invalid_argument("Invalid status value [" + status +
					"], valid values: ACTIVE, RETIRED, NON-RXNORM, NEVER%20ACTIVE");
		}
	}

	StatusEnumeration result;
	size_t prev_size = 0;
	for (const auto& status : statuses) {
		std::string key = StatusKey(status);
		Json::Value d = client_->Fetch(key);
		const Json::Value* list = Member(d, "rxcuiList");
		const Json::Value* rxcuis = list ? Member(*list, "rxcuis") : nullptr;
		if (rxcuis == nullptr || !rxcuis->isArray()) {
			throw PayloadFormatError("Status listing without rxcuiList.rxcuis for [" + key + "]");
		}
		size_t listed = 0;
		for (const Json::Value& v : *rxcuis) {
			int64_t code = ParseCode(v, "status rxcui");
			result.codes.insert(code);
			result.status_of[code] = status;
			++listed;
		}
		if (verbose) {
			LOG(INFO) << key;
			LOG(INFO) << "CodesWithStatuses: [" << status << "] : " << listed
				<< ", delta: " << result.codes.size() - prev_size
				<< ", tot: " << result.codes.size();
		}
		prev_size = result.codes.size();
	}
	return result;
}

std::vector<int64_t> RelatedCodesForTtys(const Json::Value& all_related,
		const absl::flat_hash_set<std::string>& ttys) {
	std::vector<int64_t> codes;
	const Json::Value* group = Member(all_related, "allRelatedGroup");
	const Json::Value* concept_groups = group ? Member(*group, "conceptGroup") : nullptr;
	if (concept_groups == nullptr || !concept_groups->isArray()) {
		return codes;
	}
	for (const Json::Value& cg : *concept_groups) {
		const Json::Value* props = Member(cg, "conceptProperties");
		if (props == nullptr) continue;
		if (!props->isArray()) {
			throw PayloadFormatError("Non-list conceptProperties in allrelated result");
		}
		if (!ttys.contains(TextMember(cg, "tty"))) continue;
		for (const Json::Value& p : *props) {
			const Json::Value* rxcui = Member(p, "rxcui");
			if (rxcui == nullptr) {
				throw PayloadFormatError("allrelated concept without rxcui");
			}
			codes.push_back(ParseCode(*rxcui, "allrelated rxcui"));
		}
	}
	return codes;
}

std::vector<std::string> LeafClassIds(const Json::Value& class_tree) {
	absl::btree_set<std::string> leaves;
	const Json::Value* roots = Member(class_tree, "rxclassTree");
	if (roots != nullptr) {
		CollectLeaves(*roots, leaves);
	}
	return std::vector<std::string>(leaves.begin(), leaves.end());
}

} // namespace Rxcache
