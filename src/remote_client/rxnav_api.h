#ifndef RXCACHE_RXNAV_API_H_
#define RXCACHE_RXNAV_API_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"

namespace Rxcache {

class RemoteClient;

// Fields of an rxcuihistory concept
enum class HistoryField {
	kName,
	kTty,
	kStatus,
	kStart,
	kEnd,
	kScdRxcui,
	kBossRxcuis,
};

// "NAME", "TTY", ... Throws std::invalid_argument for anything else
HistoryField ParseHistoryField(const std::string& name);
const char* HistoryFieldName(HistoryField field);

// NAME/TTY/STATUS/START/END are text, SCDRXCUI an optional code, BOSSRXCUIS a code list
using HistoryValue = std::variant<std::string, std::optional<int64_t>, std::vector<int64_t>>;

enum class TtyCategory {
	kIngredient,
	kDrug,
	kOther,
};

// IN/MIN/PIN are ingredients, SCD/SBD/GPCK/BPCK drugs
TtyCategory CategoryForTty(const std::string& tty);
const char* TtyCategoryName(TtyCategory category);

// Status values as they appear in request keys ("NEVER%20ACTIVE" is pre-escaped)
extern const char* const kStatusActive;
extern const char* const kStatusRetired;
extern const char* const kStatusNeverActive;
extern const char* const kStatusNonRxnorm;
const std::vector<std::string>& ValidStatusValues();

struct StatusEnumeration {
	absl::btree_set<int64_t> codes;
	// Last status listing a code wins
	absl::flat_hash_map<int64_t, std::string> status_of;
};

/**
 * Request keys for the RxNav REST endpoints the cache covers, and the
 * projections callers need out of the returned documents. Every call goes
 * through the RemoteClient, so with a strict client this is a pure cache
 * reader.
 */
class RxNavApi {
	public:
		RxNavApi(RemoteClient* client, std::string base_url);

		std::string AllRelatedKey(int64_t code) const;
		std::string HistoryKey(int64_t code) const;
		std::string NdcKey(int64_t code) const;
		std::string ClassTreeKey(const std::string& class_id) const;
		std::string ClassMembersKey(const std::string& class_id) const;
		std::string StatusKey(const std::string& status) const;

		Json::Value AllRelated(int64_t code);
		Json::Value HistoricalConcept(int64_t code);

		// nullopt when the concept block is absent from the response
		std::optional<std::vector<HistoryValue>> HistoricalAttributes(int64_t code,
				const std::vector<HistoryField>& fields);

		// History TTY of a code, empty when the service has no concept for it
		std::string HistoryTty(int64_t code);

		absl::btree_set<std::string> NdcCodesFor(int64_t code);
		Json::Value ClassTree(const std::string& root_class_id);
		std::vector<int64_t> GenericDrugsForVaClass(const std::string& class_id);

		// Throws std::invalid_argument on a status outside ValidStatusValues()
		StatusEnumeration CodesWithStatuses(const std::vector<std::string>& statuses, bool verbose = false);

		RemoteClient* client() { return client_; }
		const std::string& base_url() const { return base_url_; }

	private:
		RemoteClient* client_;
		std::string base_url_;
};

// Codes in the concept groups of an allrelated document whose TTY is in ttys
std::vector<int64_t> RelatedCodesForTtys(const Json::Value& all_related,
		const absl::flat_hash_set<std::string>& ttys);

// Class ids of the nodes without children in a classTree document, sorted
std::vector<std::string> LeafClassIds(const Json::Value& class_tree);

} // namespace Rxcache

#endif // RXCACHE_RXNAV_API_H_
