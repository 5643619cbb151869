#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../src/common/errors.h"
#include "../src/cache_store/cache_store.h"
#include "../src/remote_client/cache_query_service.h"
#include "../src/remote_client/remote_client.h"
#include "../src/remote_client/rxnav_api.h"
#include "test_helpers.h"

using namespace Rxcache;
using Rxcache::testing_util::MockTransport;
using Rxcache::testing_util::TempDir;
using ::testing::_;
using ::testing::Return;

namespace {

const char kBase[] = "https://rxnav.nlm.nih.gov/REST";

const char kHistory[] = R"({"rxcuiHistoryConcept":
 {"rxcuiConcept":
    {"status":"Retired","rxcui":"991041","tty":"SBD",
     "str":"Chlorpromazine hydrochloride 10 MG Oral Tablet [Thorazine]",
     "startDate":"062010","endDate":"022013","scdRxcui":"991039"},
  "bossConcept":[{"baseRxcui":"2403","bossRxcui":"104728"},{"baseRxcui":"1","bossRxcui":""}]}})";

const char kAllRelated[] = R"({"allRelatedGroup":{"rxcui":"1049214","conceptGroup":[
 {"tty":"BN","conceptProperties":[{"rxcui":"216903","name":"Endocet"}]},
 {"tty":"IN","conceptProperties":[{"rxcui":"161"},{"rxcui":"7804"}]},
 {"tty":"PIN"},
 {"tty":"SCD","conceptProperties":[{"rxcui":"1049221"}]}]}})";

const char kNdcs[] = R"({"historicalNdcConcept":{"historicalNdcTime":[
 {"status":"direct","rxcui":"1","ndcTime":[{"ndc":["00002"],"startDate":"2007"},{"ndc":["00001","00002"]}]},
 {"status":"indirect","rxcui":"2","ndcTime":[{"ndc":["00003"]}]}]}})";

const char kClassTree[] = R"({"rxclassTree":[{"rxclassMinConceptItem":{"classId":"VA000","className":"VA CLASSES"},
 "rxclassTree":[
  {"rxclassMinConceptItem":{"classId":"AM000","className":"ANTIMICROBIALS"},
   "rxclassTree":[{"rxclassMinConceptItem":{"classId":"AM100","className":"PENICILLINS"}},
                  {"rxclassMinConceptItem":{"classId":"AM110","className":"CEPHALOSPORINS"}}]},
  {"rxclassMinConceptItem":{"classId":"XX000","className":"MISC"}}]}]})";

// Cache records hold one line per payload
std::string OneLine(std::string text) {
    text.erase(std::remove(text.begin(), text.end(), '\n'), text.end());
    return text;
}

}  // namespace

class RxNavApiTest : public ::testing::Test {
protected:
    RxNavApiTest()
        : client_(nullptr, &transport_, nullptr, Options()),
          api_(&client_, std::string(kBase) + "/") {}

    static RemoteClientOptions Options() {
        RemoteClientOptions options;
        options.retry_delay = std::chrono::milliseconds(0);
        options.retry_limit = 1;
        return options;
    }

    void Serve(const std::string& url, const std::string& body) {
        EXPECT_CALL(transport_, Get(url)).WillRepeatedly(Return(HttpResponse{200, body}));
    }

    MockTransport transport_;
    RemoteClient client_;
    RxNavApi api_;
};

TEST_F(RxNavApiTest, RequestKeys) {
    EXPECT_EQ(api_.AllRelatedKey(161), "https://rxnav.nlm.nih.gov/REST/rxcui/161/allrelated.json");
    EXPECT_EQ(api_.HistoryKey(161), "https://rxnav.nlm.nih.gov/REST/rxcuihistory/concept.json?rxcui=161");
    EXPECT_EQ(api_.NdcKey(161), "https://rxnav.nlm.nih.gov/REST/rxcui/161/allhistoricalndcs/json");
    EXPECT_EQ(api_.ClassTreeKey("VA000"), "https://rxnav.nlm.nih.gov/REST/rxclass/classTree/json?classId=VA000");
    EXPECT_EQ(api_.ClassMembersKey("AM100"),
              "https://rxnav.nlm.nih.gov/REST/rxclass/classMembers.json?classId=AM100"
              "&relaSource=VA&rela=has_VAClass&ttys=SCD+GPCK");
    EXPECT_EQ(api_.StatusKey(kStatusNeverActive),
              "https://rxnav.nlm.nih.gov/REST/rxcuihistory/status.json?type=NEVER%20ACTIVE");
}

TEST_F(RxNavApiTest, HistoricalAttributesInRequestedOrder) {
    Serve(api_.HistoryKey(991041), kHistory);
    auto values = api_.HistoricalAttributes(991041, {HistoryField::kTty, HistoryField::kName,
                                                     HistoryField::kStatus, HistoryField::kStart,
                                                     HistoryField::kEnd, HistoryField::kScdRxcui,
                                                     HistoryField::kBossRxcuis});
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values->size(), 7u);
    EXPECT_EQ(std::get<std::string>((*values)[0]), "SBD");
    EXPECT_EQ(std::get<std::string>((*values)[1]), "Chlorpromazine hydrochloride 10 MG Oral Tablet [Thorazine]");
    EXPECT_EQ(std::get<std::string>((*values)[2]), "Retired");
    EXPECT_EQ(std::get<std::string>((*values)[3]), "062010");
    EXPECT_EQ(std::get<std::string>((*values)[4]), "022013");
    EXPECT_EQ(std::get<std::optional<int64_t>>((*values)[5]), std::optional<int64_t>(991039));
    EXPECT_EQ(std::get<std::vector<int64_t>>((*values)[6]), std::vector<int64_t>{104728});
    EXPECT_EQ(api_.HistoryTty(991041), "SBD");
}

TEST_F(RxNavApiTest, HistoricalAttributesMissingConceptIsEmpty) {
    Serve(api_.HistoryKey(5), R"({"rxcuiHistoryConcept":{}})");
    EXPECT_FALSE(api_.HistoricalAttributes(5, {HistoryField::kTty}).has_value());
    EXPECT_EQ(api_.HistoryTty(5), "");
}

TEST_F(RxNavApiTest, EmptyScdRxcuiIsNull) {
    Serve(api_.HistoryKey(7), R"({"rxcuiHistoryConcept":{"rxcuiConcept":{"tty":"IN","scdRxcui":""}}})");
    auto values = api_.HistoricalAttributes(7, {HistoryField::kScdRxcui, HistoryField::kBossRxcuis});
    ASSERT_TRUE(values.has_value());
    EXPECT_FALSE(std::get<std::optional<int64_t>>((*values)[0]).has_value());
    EXPECT_TRUE(std::get<std::vector<int64_t>>((*values)[1]).empty());
}

TEST_F(RxNavApiTest, NumericRelatedCodesAccepted) {
    Serve(api_.HistoryKey(8), R"({"rxcuiHistoryConcept":{"rxcuiConcept":{"tty":"SBD","scdRxcui":991039},
                                 "bossConcept":[{"bossRxcui":104728},{"bossRxcui":null}]}})");
    auto values = api_.HistoricalAttributes(8, {HistoryField::kScdRxcui, HistoryField::kBossRxcuis});
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(std::get<std::optional<int64_t>>((*values)[0]), std::optional<int64_t>(991039));
    EXPECT_EQ(std::get<std::vector<int64_t>>((*values)[1]), std::vector<int64_t>{104728});
}

TEST_F(RxNavApiTest, MalformedScdRxcuiIsPayloadError) {
    Serve(api_.HistoryKey(9), R"({"rxcuiHistoryConcept":{"rxcuiConcept":{"scdRxcui":"SCD-1"}}})");
    EXPECT_THROW(api_.HistoricalAttributes(9, {HistoryField::kScdRxcui}), PayloadFormatError);
}

TEST(HistoryFieldTest, ParseByName) {
    EXPECT_EQ(ParseHistoryField("BOSSRXCUIS"), HistoryField::kBossRxcuis);
    EXPECT_STREQ(HistoryFieldName(ParseHistoryField("SCDRXCUI")), "SCDRXCUI");
    EXPECT_THROW(ParseHistoryField("COLOR"), std::invalid_argument);
    EXPECT_THROW(ParseHistoryField("name"), std::invalid_argument);
}

TEST_F(RxNavApiTest, NdcCodesFlattenedAndDeduplicated) {
    Serve(api_.NdcKey(1), kNdcs);
    auto ndcs = api_.NdcCodesFor(1);
    EXPECT_EQ(std::vector<std::string>(ndcs.begin(), ndcs.end()),
              (std::vector<std::string>{"00001", "00002", "00003"}));
}

TEST_F(RxNavApiTest, NdcCodesForNullConcept) {
    Serve(api_.NdcKey(2), R"({"historicalNdcConcept":null})");
    EXPECT_TRUE(api_.NdcCodesFor(2).empty());
}

TEST_F(RxNavApiTest, GenericDrugsForVaClass) {
    Serve(api_.ClassMembersKey("AM100"),
          R"({"drugMemberGroup":{"drugMember":[{"minConcept":{"rxcui":"308182","tty":"SCD"}},
                                               {"minConcept":{"rxcui":"308191","tty":"SCD"}}]}})");
    Serve(api_.ClassMembersKey("AM110"), R"({"drugMemberGroup":{}})");
    EXPECT_EQ(api_.GenericDrugsForVaClass("AM100"), (std::vector<int64_t>{308182, 308191}));
    EXPECT_TRUE(api_.GenericDrugsForVaClass("AM110").empty());
}

TEST_F(RxNavApiTest, CodesWithStatusesUnionsListings) {
    Serve(api_.StatusKey(kStatusActive), R"({"rxcuiList":{"rxcuis":["3","1","2"]}})");
    Serve(api_.StatusKey(kStatusRetired), R"({"rxcuiList":{"rxcuis":["4","2"]}})");
    StatusEnumeration result = api_.CodesWithStatuses({kStatusActive, kStatusRetired}, true);
    EXPECT_EQ(std::vector<int64_t>(result.codes.begin(), result.codes.end()),
              (std::vector<int64_t>{1, 2, 3, 4}));
    EXPECT_EQ(result.status_of.at(1), kStatusActive);
    EXPECT_EQ(result.status_of.at(2), kStatusRetired);
}

TEST_F(RxNavApiTest, CodesWithStatusesRejectsUnknownStatus) {
    EXPECT_CALL(transport_, Get(_)).Times(0);
    EXPECT_THROW(api_.CodesWithStatuses({kStatusActive, "NEVER ACTIVE"}), std::invalid_argument);
}

TEST_F(RxNavApiTest, MalformedStatusListingIsPayloadError) {
    Serve(api_.StatusKey(kStatusActive), R"({"rxcuiList":{"rxcuis":["12x"]}})");
    EXPECT_THROW(api_.CodesWithStatuses({kStatusActive}), PayloadFormatError);
}

TEST_F(RxNavApiTest, AllRelatedProjection) {
    Serve(api_.AllRelatedKey(1049214), kAllRelated);
    Json::Value d = api_.AllRelated(1049214);
    EXPECT_EQ(RelatedCodesForTtys(d, {"IN", "PIN"}), (std::vector<int64_t>{161, 7804}));
    EXPECT_EQ(RelatedCodesForTtys(d, {"SCD", "SBD", "GPCK", "BPCK"}), (std::vector<int64_t>{1049221}));
    EXPECT_TRUE(RelatedCodesForTtys(d, {"MIN"}).empty());
}

TEST(RelatedCodesTest, NonListConceptPropertiesRejected) {
    Json::Value d;
    Json::Value group;
    group["tty"] = "IN";
    group["conceptProperties"]["rxcui"] = "1";
    d["allRelatedGroup"]["conceptGroup"].append(group);
    EXPECT_THROW(RelatedCodesForTtys(d, {"IN"}), PayloadFormatError);
}

TEST_F(RxNavApiTest, LeafClassesOfTree) {
    Serve(api_.ClassTreeKey("VA000"), kClassTree);
    EXPECT_EQ(LeafClassIds(api_.ClassTree("VA000")),
              (std::vector<std::string>{"AM100", "AM110", "XX000"}));
}

TEST(TtyCategoryTest, Categories) {
    for (const char* tty : {"IN", "MIN", "PIN"}) {
        EXPECT_EQ(CategoryForTty(tty), TtyCategory::kIngredient) << tty;
    }
    for (const char* tty : {"SCD", "SBD", "GPCK", "BPCK"}) {
        EXPECT_EQ(CategoryForTty(tty), TtyCategory::kDrug) << tty;
    }
    EXPECT_EQ(CategoryForTty("BN"), TtyCategory::kOther);
    EXPECT_EQ(CategoryForTty(""), TtyCategory::kOther);
    EXPECT_STREQ(TtyCategoryName(CategoryForTty("SCD")), "DRUG");
}

TEST(CacheQueryServiceTest, ServesOnlyWhatIsCached) {
    TempDir dir;
    const std::string path = dir.File("rxnav.cache");
    RxNavApi keys(nullptr, kBase);
    {
        auto store = CacheStore::Open(path, StoreMode::kAppend);
        store->LoadIndex();
        store->Append(keys.HistoryKey(991041), OneLine(kHistory), "20261019");
        store->Append(keys.NdcKey(1), OneLine(kNdcs), "20261019");
    }

    auto service = CacheQueryService::Open(path, kBase);
    auto tty = service->HistoricalAttributes(991041, {HistoryField::kTty});
    ASSERT_TRUE(tty.has_value());
    EXPECT_EQ(std::get<std::string>((*tty)[0]), "SBD");
    EXPECT_EQ(service->NdcCodesFor(1).size(), 3u);
    EXPECT_EQ(service->Lookup(keys.NdcKey(1)), OneLine(kNdcs));

    EXPECT_THROW(service->AllRelated(991041), NotCached);
    EXPECT_EQ(service->counters().remote_calls, 0u);
    EXPECT_EQ(service->counters().cache_hits, 3u);
}
