#include "skyhop/checksum.hpp"
#include "skyhop/chunker.hpp"
#include "skyhop/errors.hpp"
#include "skyhop/object_store.hpp"

#include <cassert>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace {

// Read-only store whose objects are generated on demand, so large objects
// need no backing memory.
class PatternStore : public skyhop::ObjectStore {
  public:
    void add(const std::string &key, std::uint64_t length) { sizes_[key] = length; }

    std::vector<char> get(const std::string &key, std::uint64_t offset, std::uint64_t length) override {
        auto it = sizes_.find(key);
        if (it == sizes_.end() || offset + length > it->second) {
            throw skyhop::ObjectStoreError("no such range in " + key, false);
        }
        std::vector<char> data(static_cast<std::size_t>(length));
        for (std::size_t i = 0; i < data.size(); ++i) {
            data[i] = static_cast<char>((offset + i) * 31 % 251);
        }
        return data;
    }

    void put(const std::string &, std::uint64_t, const std::vector<char> &) override {
        throw skyhop::ObjectStoreError("read-only store", false);
    }

    std::vector<std::string> list(const std::string &) override { return {}; }

    void remove(const std::string &) override {}

    std::uint64_t size(const std::string &key) override { return sizes_.at(key); }

  private:
    std::map<std::string, std::uint64_t> sizes_;
};

std::shared_ptr<const skyhop::TransferJob> make_job(const std::vector<skyhop::ObjectSpec> &objects) {
    auto job = std::make_shared<skyhop::TransferJob>();
    job->id = 7;
    job->source_region = "aws:us-east-1";
    job->destination_regions = {"gcp:europe-west1"};
    job->objects = objects;
    return job;
}

void test_large_object_split() {
    auto store = std::make_shared<PatternStore>();
    store->add("big.bin", 300000000);
    skyhop::ChunkPolicy policy;
    policy.chunk_bytes = 64000000;
    skyhop::Chunker chunker(store, policy);

    auto chunks = chunker.chunk_all(make_job({{"big.bin", "copy/big.bin", 300000000}}));
    assert(chunks.size() == 5);
    std::uint64_t covered = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        assert(chunks[i].id == i);
        assert(chunks[i].job_id == 7);
        assert(chunks[i].offset == covered);
        assert(chunks[i].destination_key == "copy/big.bin");
        covered += chunks[i].length;
    }
    assert(covered == 300000000);
    assert(chunks[0].length == 64000000);
    assert(chunks[4].length == 44000000);

    auto tail = store->get("big.bin", chunks[4].offset, chunks[4].length);
    assert(chunks[4].checksum == skyhop::Checksum::crc32(tail));
}

void test_small_objects_and_restart() {
    auto store = std::make_shared<skyhop::MemoryObjectStore>();
    store->insert("a", std::vector<char>(5000, 'a'));
    store->insert("empty", {});
    store->insert("b", std::vector<char>(2500, 'b'));

    skyhop::ChunkPolicy policy;
    policy.min_chunk_bytes = 1000;
    policy.chunk_bytes = 1000;
    policy.whole_object_bytes = 3000;
    skyhop::Chunker chunker(store, policy);
    auto job = make_job({{"a", "a", 5000}, {"empty", "empty", 0}, {"b", "b", 2500}});

    auto all = chunker.chunk_all(job);
    // five 1000-byte chunks, one empty chunk, and b whole
    assert(all.size() == 7);
    assert(all[5].length == 0 && all[5].object_index == 1);
    assert(all[5].checksum == 0);
    assert(all[6].length == 2500 && all[6].object_index == 2);
    assert(all[6].checksum == skyhop::Checksum::crc32(std::vector<char>(2500, 'b')));

    auto sequence = chunker.chunk(job);
    sequence.next();
    sequence.next();
    auto mark = sequence.position();
    auto third = sequence.next();
    assert(third && third->id == 2 && third->offset == 2000);
    sequence.seek(mark);
    auto again = sequence.next();
    assert(again && again->id == third->id && again->checksum == third->checksum);

    sequence.restart();
    std::vector<skyhop::Chunk> replay;
    while (auto chunk = sequence.next()) {
        replay.push_back(*chunk);
    }
    assert(sequence.done());
    assert(replay.size() == all.size());
    for (std::size_t i = 0; i < all.size(); ++i) {
        assert(replay[i].id == all[i].id && replay[i].offset == all[i].offset &&
               replay[i].checksum == all[i].checksum);
    }
}

void test_part_limit() {
    skyhop::ChunkPolicy policy;
    policy.min_chunk_bytes = 1;
    policy.chunk_bytes = 10;
    policy.whole_object_bytes = 10;
    policy.max_parts_per_object = 4;
    // 100 bytes in 10-byte chunks would need 10 parts.
    assert(policy.chunk_size_for(100) == 25);
    assert(policy.chunk_size_for(8) == 8);

    skyhop::ChunkPolicy invalid;
    invalid.min_chunk_bytes = 0;
    bool rejected = false;
    try {
        invalid.validate();
    } catch (const skyhop::ConfigError &) {
        rejected = true;
    }
    assert(rejected);
}

void test_object_beyond_part_limit_rejected() {
    skyhop::ChunkPolicy policy;
    policy.min_chunk_bytes = 1;
    policy.chunk_bytes = 10;
    policy.whole_object_bytes = 10;
    policy.max_chunk_bytes = 20;
    policy.max_parts_per_object = 4;
    assert(policy.chunk_size_for(80) == 20);

    // 4 parts of at most 20 bytes cannot hold 100 bytes.
    bool rejected = false;
    try {
        policy.chunk_size_for(100);
    } catch (const skyhop::ConfigError &) {
        rejected = true;
    }
    assert(rejected);

    auto store = std::make_shared<PatternStore>();
    store->add("ok.bin", 80);
    store->add("huge.bin", 100);
    skyhop::Chunker chunker(store, policy);
    rejected = false;
    try {
        chunker.chunk(make_job({{"ok.bin", "ok.bin", 80}, {"huge.bin", "huge.bin", 100}}));
    } catch (const skyhop::ConfigError &) {
        rejected = true;
    }
    assert(rejected);
    assert(chunker.chunk_all(make_job({{"ok.bin", "ok.bin", 80}})).size() == 4);
}

} // namespace

int main() {
    test_large_object_split();
    test_small_objects_and_restart();
    test_part_limit();
    test_object_beyond_part_limit_rejected();
    return 0;
}
