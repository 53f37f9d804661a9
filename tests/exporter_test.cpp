#include "exporter/dump.hpp"
#include "fake_module.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <thread>

class ExporterTest : public ::testing::Test {
  protected:
    FakeLoader loader;
    Attacher   attacher{ loader };
    DecoderSet decoders;

    std::vector<Program> programs;

    std::shared_ptr<FakeTables> tables;

    void SetUp() override {
        Program program;

        program.name = "bio";

        Counter counter;

        counter.name   = "bio_requests_total";
        counter.help   = "Block IO requests";
        counter.table  = "counts";
        counter.labels = { make_label("disk"), make_label("op") };

        Histogram histogram;

        histogram.name   = "bio_latency";
        histogram.help   = "Block IO latency";
        histogram.table  = "latency";
        histogram.labels = { make_label("disk"), make_label("op") };
        histogram.bucket = make_label("bucket", { make_decoding("uint") });

        program.counters.push_back(counter);
        program.histograms.push_back(histogram);

        programs.push_back(program);

        FakeModule module;

        (*module.tables)["counts"]  = { { "{sda read}", "10" }, { "{sda write}", "2" } };
        (*module.tables)["latency"] = {
            { "{sda read 1}", "10" },
            { "{sda read 2}", "2" },
            { "{sdb write 1}", "1" },
            { "{sda read 4}", "5" },
        };

        tables = module.tables;

        loader.modules["bio"] = module;

        ASSERT_EQ(attacher.attach(programs), 0);
    }

    static const prometheus::MetricFamily* find(const std::vector<prometheus::MetricFamily>& families,
                                                const std::string& name) {
        for (auto it = families.begin(); it != families.end(); it++) {
            if ((*it).name == name) return &*it;
        }

        return nullptr;
    }

    static std::vector<std::string> values(const prometheus::ClientMetric& metric) {
        std::vector<std::string> result;

        for (auto it = metric.label.begin(); it != metric.label.end(); it++) {
            result.push_back((*it).value);
        }

        return result;
    }
};

TEST_F(ExporterTest, DescribeUsesNamespaceAndDropsBucketLabel) {
    Exporter exporter(programs, attacher, decoders);

    auto descs = exporter.describe();

    ASSERT_EQ(descs.size(), 2u);

    EXPECT_EQ(descs[0]->name, "ebpf_exporter_bio_requests_total");
    EXPECT_EQ(descs[0]->help, "Block IO requests");
    EXPECT_EQ(descs[0]->labels, (std::vector<std::string>{ "disk", "op" }));
    EXPECT_EQ(descs[0]->type, prometheus::MetricType::Counter);

    EXPECT_EQ(descs[1]->name, "ebpf_exporter_bio_latency");
    EXPECT_EQ(descs[1]->labels, (std::vector<std::string>{ "disk", "op" }));
    EXPECT_EQ(descs[1]->type, prometheus::MetricType::Histogram);
}

TEST_F(ExporterTest, DescriptorIdentityIsStableAcrossScrapes) {
    Exporter exporter(programs, attacher, decoders);

    auto first = exporter.describe();

    for (int i = 0; i < 5; i++) {
        exporter.Collect();

        auto again = exporter.describe();

        ASSERT_EQ(again.size(), first.size());

        for (size_t j = 0; j < first.size(); j++) {
            EXPECT_EQ(again[j].get(), first[j].get());
        }
    }
}

TEST_F(ExporterTest, ConcurrentFirstRequestsShareDescriptors) {
    Exporter exporter(programs, attacher, decoders);

    std::vector<std::vector<std::shared_ptr<const Descriptor>>> results(8);
    std::vector<std::thread>                                    threads;

    for (size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&exporter, &results, i]() {
            if (i % 2) exporter.Collect();
            results[i] = exporter.describe();
        });
    }

    for (auto it = threads.begin(); it != threads.end(); it++) {
        (*it).join();
    }

    for (size_t i = 1; i < results.size(); i++) {
        ASSERT_EQ(results[i].size(), results[0].size());

        for (size_t j = 0; j < results[0].size(); j++) {
            EXPECT_EQ(results[i][j].get(), results[0][j].get());
        }
    }
}

TEST_F(ExporterTest, CollectsCounters) {
    Exporter exporter(programs, attacher, decoders);

    auto families = exporter.Collect();

    const prometheus::MetricFamily* family = find(families, "ebpf_exporter_bio_requests_total");

    ASSERT_NE(family, nullptr);
    EXPECT_EQ(family->type, prometheus::MetricType::Counter);
    EXPECT_EQ(family->help, "Block IO requests");
    ASSERT_EQ(family->metric.size(), 2u);

    EXPECT_EQ(family->metric[0].label[0].name, "disk");
    EXPECT_EQ(family->metric[0].label[1].name, "op");
    EXPECT_EQ(values(family->metric[0]), (std::vector<std::string>{ "sda", "read" }));
    EXPECT_DOUBLE_EQ(family->metric[0].counter.value, 10);
    EXPECT_EQ(values(family->metric[1]), (std::vector<std::string>{ "sda", "write" }));
    EXPECT_DOUBLE_EQ(family->metric[1].counter.value, 2);
}

TEST_F(ExporterTest, CollectsCumulativeHistograms) {
    Exporter exporter(programs, attacher, decoders);

    auto families = exporter.Collect();

    const prometheus::MetricFamily* family = find(families, "ebpf_exporter_bio_latency");

    ASSERT_NE(family, nullptr);
    EXPECT_EQ(family->type, prometheus::MetricType::Histogram);
    ASSERT_EQ(family->metric.size(), 2u);

    const prometheus::ClientMetric& sda = family->metric[0];

    EXPECT_EQ(values(sda), (std::vector<std::string>{ "sda", "read" }));
    EXPECT_EQ(sda.histogram.sample_count, 17u);
    EXPECT_DOUBLE_EQ(sda.histogram.sample_sum, 0);

    ASSERT_EQ(sda.histogram.bucket.size(), 3u);
    EXPECT_DOUBLE_EQ(sda.histogram.bucket[0].upper_bound, 1);
    EXPECT_EQ(sda.histogram.bucket[0].cumulative_count, 10u);
    EXPECT_DOUBLE_EQ(sda.histogram.bucket[1].upper_bound, 2);
    EXPECT_EQ(sda.histogram.bucket[1].cumulative_count, 12u);
    EXPECT_DOUBLE_EQ(sda.histogram.bucket[2].upper_bound, 4);
    EXPECT_EQ(sda.histogram.bucket[2].cumulative_count, 17u);

    for (auto it = sda.histogram.bucket.begin(); it != sda.histogram.bucket.end(); it++) {
        EXPECT_FALSE(std::isinf((*it).upper_bound));
    }

    EXPECT_EQ(values(family->metric[1]), (std::vector<std::string>{ "sdb", "write" }));
    EXPECT_EQ(family->metric[1].histogram.sample_count, 1u);
}

TEST_F(ExporterTest, MalformedBucketDropsOnlyThatHistogram) {
    (*tables)["latency"].push_back({ "{sdc read 1ms}", "3" });

    Exporter exporter(programs, attacher, decoders);

    auto families = exporter.Collect();

    EXPECT_EQ(find(families, "ebpf_exporter_bio_latency"), nullptr);
    EXPECT_NE(find(families, "ebpf_exporter_bio_requests_total"), nullptr);
}

TEST_F(ExporterTest, TableErrorDropsOnlyThatMetric) {
    (*tables)["counts"].push_back({ "{sda}", "1" });

    Exporter exporter(programs, attacher, decoders);

    auto families = exporter.Collect();

    EXPECT_EQ(find(families, "ebpf_exporter_bio_requests_total"), nullptr);
    EXPECT_NE(find(families, "ebpf_exporter_bio_latency"), nullptr);

    // 下一轮抓取自然恢复
    (*tables)["counts"].pop_back();

    families = exporter.Collect();

    EXPECT_NE(find(families, "ebpf_exporter_bio_requests_total"), nullptr);
}

TEST_F(ExporterTest, TransformErrorDropsOnlyThatGroup) {
    Histogram& histogram = programs[0].histograms[0];

    histogram.bucket_keys = { 1, 2, 4 };

    (*tables)["latency"].push_back({ "{sdb write 8}", "1" });

    Exporter exporter(programs, attacher, decoders);

    auto families = exporter.Collect();

    const prometheus::MetricFamily* family = find(families, "ebpf_exporter_bio_latency");

    ASSERT_NE(family, nullptr);
    ASSERT_EQ(family->metric.size(), 1u);
    EXPECT_EQ(values(family->metric[0]), (std::vector<std::string>{ "sda", "read" }));
}

TEST_F(ExporterTest, ReadsEachTableOncePerMetric) {
    Exporter exporter(programs, attacher, decoders);

    const FakeModule* module = dynamic_cast<const FakeModule*>(attacher.module("bio"));

    ASSERT_NE(module, nullptr);

    int before = *module->reads;

    exporter.Collect();

    EXPECT_EQ(*module->reads - before, 2);
}

TEST_F(ExporterTest, TablesDump) {
    Exporter exporter(programs, attacher, decoders);

    Tables dump = exporter.tables();

    ASSERT_EQ(dump.size(), 1u);
    ASSERT_EQ(dump["bio"].size(), 2u);
    EXPECT_EQ(dump["bio"]["counts"].size(), 2u);
    EXPECT_EQ(dump["bio"]["latency"].size(), 4u);
    EXPECT_EQ(dump["bio"]["latency"][0].labels, (std::vector<std::string>{ "sda", "read", "1" }));

    std::string text = format_tables(dump);

    EXPECT_NE(text.find("## Program: bio\n\n"), std::string::npos);
    EXPECT_NE(text.find("### Table: counts\n\n```\n"), std::string::npos);
    EXPECT_NE(text.find("{sda read} ([sda read]) -> 10.000000\n"), std::string::npos);
    EXPECT_NE(text.find("{sda read 4} ([sda read 4]) -> 5.000000\n"), std::string::npos);
}

TEST_F(ExporterTest, TablesHandlerReportsErrors) {
    Exporter exporter(programs, attacher, decoders);

    httplib::Request  req;
    httplib::Response res;

    tables_handler(exporter, req, res);

    EXPECT_EQ(res.status, 200);
    EXPECT_NE(res.body.find("### Table: latency"), std::string::npos);

    tables->erase("counts");

    httplib::Response failed;

    tables_handler(exporter, req, failed);

    EXPECT_EQ(failed.status, 500);
    EXPECT_NE(failed.body.find("counts"), std::string::npos);
}

TEST_F(ExporterTest, UnattachedProgramIsSkipped) {
    Program other = programs[0];

    other.name = "other";

    std::vector<Program> all = { programs[0], other };

    Exporter exporter(all, attacher, decoders);

    auto families = exporter.Collect();

    const prometheus::MetricFamily* family = find(families, "ebpf_exporter_bio_requests_total");

    ASSERT_NE(family, nullptr);
    EXPECT_EQ(family->metric.size(), 2u);

    EXPECT_THROW(exporter.tables(), TableError);
}
