#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "seqbatch/seqbatch.hh"
#include "tests/TestSuite.hh"

namespace seqbatch {

namespace {

using test::drain;
using test::fill;
using test::make_record;
using test::TempDir;
using test::VectorStore;
using test::write_text;

// No BOS/EOS, with marker values far from any token used below.
Alignment plain() {
  Alignment alignment;
  alignment.add_bos_x = false;
  alignment.add_eos_x = false;
  alignment.add_bos_y = false;
  alignment.add_eos_y = false;
  alignment.bos = 100;  // NOLINT
  alignment.eos = 101;  // NOLINT
  return alignment;
}

BatchIterable::Config budget(size_t max_tokens) {
  BatchIterable::Config config;
  config.max_tokens = max_tokens;
  config.alignment = plain();
  return config;
}

// Parallel records whose sides are both `length` long, `copies` of each
// length in [1, longest].
SeqPairs ladder(size_t longest, size_t copies) {
  SeqPairs pairs;
  for (size_t length = 1; length <= longest; length++) {
    for (size_t i = 0; i < copies; i++) {
      pairs.emplace_back(fill(length), fill(length));
    }
  }
  return pairs;
}

}  // namespace

void blob_codec() {
  Words words = {0, 1, -1, 127, 128, -300, 2147483647, -2147483648LL};
  std::string blob = io::encode_words(words);
  SEQBATCH_CHECK(static_cast<uint8_t>(blob[0]) == kBlobVersion);
  SEQBATCH_CHECK(io::decode_words(blob.data(), blob.size()) == words);

  std::string empty = io::encode_words({});
  SEQBATCH_CHECK(io::decode_words(empty.data(), empty.size()).empty());

  std::string truncated = blob.substr(0, blob.size() - 1);
  SEQBATCH_CHECK_THROWS(io::decode_words(truncated.data(), truncated.size()),
                        MalformedRecordError);

  std::string unknown = blob;
  unknown[0] = 0x7f;  // NOLINT
  SEQBATCH_CHECK_THROWS(io::decode_words(unknown.data(), unknown.size()),
                        MalformedRecordError);
}

void parse_words() {
  Words words;
  SEQBATCH_CHECK(io::parse_words("  4 5\t-6 ", words));
  SEQBATCH_CHECK((words == Words{4, 5, -6}));

  Words none;
  SEQBATCH_CHECK(io::parse_words("", none));
  SEQBATCH_CHECK(none.empty());

  Words bad;
  SEQBATCH_CHECK(!io::parse_words("4 five 6", bad));
  SEQBATCH_CHECK(!io::parse_words("4x", bad));
}

void augment_idempotent() {
  Word bos = 2;
  Word eos = 3;
  Words once = augment({5, 6}, true, true, bos, eos);
  SEQBATCH_CHECK((once == Words{2, 5, 6, 3}));
  SEQBATCH_CHECK(augment(once, true, true, bos, eos) == once);

  SEQBATCH_CHECK((augment({5, 6}, false, true, bos, eos) == Words{5, 6, 3}));
  SEQBATCH_CHECK((augment({5, 6}, false, false, bos, eos) == Words{5, 6}));

  SEQBATCH_CHECK_THROWS(augment({2, 5}, false, true, bos, eos),
                        InvalidAlignmentError);
  SEQBATCH_CHECK_THROWS(augment({5, 3}, true, false, bos, eos),
                        InvalidAlignmentError);
  SEQBATCH_CHECK_THROWS(augment({}, true, true, bos, eos),
                        InvalidAlignmentError);
}

void batch_example() {
  Records records = {make_record(0, {5, 6}, Words{7}),
                     make_record(1, {1}, Words{2, 3, 4})};

  auto store = std::make_shared<VectorStore>(records);
  BatchIterable iterable(store, budget(6));
  std::vector<Batch> batches = drain(*iterable.pass());
  SEQBATCH_CHECK(batches.size() == 1);

  const Batch &batch = batches[0];
  SEQBATCH_CHECK(batch.size() == 2);
  SEQBATCH_CHECK(batch.x_seqs().shape() == Shape({2, 2}));
  SEQBATCH_CHECK(batch.y_seqs().shape() == Shape({2, 3}));
  SEQBATCH_CHECK((batch.x_seqs().row(0) == Words{5, 6}));
  SEQBATCH_CHECK((batch.x_seqs().row(1) == Words{1, 0}));
  SEQBATCH_CHECK((batch.y_seqs().row(0) == Words{7, 0, 0}));
  SEQBATCH_CHECK((batch.y_seqs().row(1) == Words{2, 3, 4}));
  SEQBATCH_CHECK(batch.x_toks() == 3);
  SEQBATCH_CHECK(batch.y_toks() == 4);
  SEQBATCH_CHECK((batch.ids() == Ids{0, 1}));
}

void batch_rows() {
  Records records = {make_record(10, {5, 6, 7}, Words{8}),
                     make_record(11, {9}, Words{4, 4, 4, 4}),
                     make_record(12, {2, 5}, Words{6, 3})};

  Alignment alignment;  // EOS on both sides, no BOS, pad 0.
  alignment.add_bos_x = true;
  Batch batch(records, alignment);

  SEQBATCH_CHECK(batch.size() == 3);
  SEQBATCH_CHECK(batch.has_y());
  SEQBATCH_CHECK(batch.max_x_len() == 5);
  SEQBATCH_CHECK(batch.max_y_len() == 5);

  for (size_t i = 0; i < records.size(); i++) {
    const Record &record = records[i];
    Words x = augment(record.x, true, true, alignment.bos, alignment.eos);
    Words y = augment(*record.y, false, true, alignment.bos, alignment.eos);

    Words x_row = batch.x_seqs().row(i);
    Words y_row = batch.y_seqs().row(i);
    SEQBATCH_CHECK(std::equal(x.begin(), x.end(), x_row.begin()));
    SEQBATCH_CHECK(std::equal(y.begin(), y.end(), y_row.begin()));
    SEQBATCH_CHECK(std::all_of(x_row.begin() + x.size(), x_row.end(),
                               [](Word w) { return w == 0; }));
    SEQBATCH_CHECK(std::all_of(y_row.begin() + y.size(), y_row.end(),
                               [](Word w) { return w == 0; }));
    SEQBATCH_CHECK(batch.x_len()[i] == x.size());
    SEQBATCH_CHECK(batch.y_len()[i] == y.size());
  }

  // Record 12 starts with BOS already and ends with EOS on the target side.
  SEQBATCH_CHECK((batch.x_seqs().row(2) == Words{2, 5, 3, 0, 0}));
  SEQBATCH_CHECK((batch.y_seqs().row(2) == Words{6, 3, 0, 0, 0}));
}

void batch_time_first() {
  Records records = {make_record(0, {5, 6, 7}, std::nullopt),
                     make_record(1, {8}, std::nullopt)};
  Alignment alignment = plain();
  alignment.batch_first = false;
  Batch batch(records, alignment);

  SEQBATCH_CHECK(!batch.has_y());
  SEQBATCH_CHECK(batch.y_seqs().empty());
  SEQBATCH_CHECK(batch.x_seqs().shape() == Shape({3, 2}));
  SEQBATCH_CHECK((batch.x_seqs().row(0) == Words{5, 8}));
  SEQBATCH_CHECK((batch.x_seqs().row(1) == Words{6, 0}));
  SEQBATCH_CHECK((batch.x_seqs().row(2) == Words{7, 0}));

  // Masks are always batch-major.
  Tensor mask = batch.x_mask();
  SEQBATCH_CHECK(mask.shape() == Shape({2, 3}));
  SEQBATCH_CHECK(mask.at<uint8_t>(0, 2) == 1);
  SEQBATCH_CHECK(mask.at<uint8_t>(1, 1) == 0);
}

void batch_sort_desc() {
  Records records = {make_record(0, {5}, std::nullopt),
                     make_record(1, {5, 5, 5}, std::nullopt),
                     make_record(2, {6, 6, 6}, std::nullopt),
                     make_record(3, {5, 5}, std::nullopt)};
  Alignment alignment = plain();
  alignment.sort_desc = true;
  Batch batch(records, alignment);
  SEQBATCH_CHECK((batch.ids() == Ids{1, 2, 3, 0}));
  SEQBATCH_CHECK((batch.x_len() == std::vector<size_t>{3, 3, 2, 1}));
}

void batch_alignment_errors() {
  Records mixed = {make_record(0, {5}, Words{6}),
                   make_record(1, {5}, std::nullopt)};
  SEQBATCH_CHECK_THROWS(Batch(mixed, Alignment()), InvalidAlignmentError);

  SEQBATCH_CHECK_THROWS(Batch(Records(), Alignment()), InvalidAlignmentError);

  Records with_bos = {make_record(0, {2, 5}, Words{6})};
  SEQBATCH_CHECK_THROWS(Batch(with_bos, Alignment()), InvalidAlignmentError);

  Records with_eos = {make_record(0, {5}, Words{6, 3})};
  Alignment no_eos;
  no_eos.add_eos_y = false;
  SEQBATCH_CHECK_THROWS(Batch(with_eos, no_eos), InvalidAlignmentError);

  Records no_target = {make_record(0, {5}, std::nullopt)};
  Batch batch(no_target, Alignment());
  SEQBATCH_CHECK_THROWS(batch.y_autoreg_mask(), InvalidAlignmentError);
}

void alignment_markers() {
  // SentencePiece defaults: unk=0, bos=1, eos=2, no pad piece.
  Alignment alignment = with_markers(Alignment(), -1, 1, 2, 8000);
  SEQBATCH_CHECK(alignment.pad == 8000);
  SEQBATCH_CHECK(alignment.bos == 1);
  SEQBATCH_CHECK(alignment.eos == 2);
  SEQBATCH_CHECK(with_markers(Alignment(), 0, 2, 3, 100).pad == 0);

  // Pieces 2 and 3 are ordinary tokens here, and unk (0) is not padding.
  Records records = {make_record(0, {2, 5, 3}, Words{0, 0, 4}),
                     make_record(1, {0}, Words{4})};
  SEQBATCH_CHECK_THROWS(Batch(records, Alignment()), InvalidAlignmentError);
  Batch batch(records, alignment);
  SEQBATCH_CHECK((batch.x_seqs().row(0) == Words{2, 5, 3, 2}));
  SEQBATCH_CHECK((batch.x_seqs().row(1) == Words{0, 2, 8000, 8000}));
  SEQBATCH_CHECK((batch.y_seqs().row(0) == Words{0, 0, 4, 2}));
  SEQBATCH_CHECK((batch.y_seqs().row(1) == Words{4, 2, 8000, 8000}));
  SEQBATCH_CHECK(batch.x_mask().at<uint8_t>(1, 0) == 1);
  SEQBATCH_CHECK(batch.x_mask().at<uint8_t>(1, 2) == 0);

  Alignment with_bos;
  with_bos.add_bos_x = true;
  SEQBATCH_CHECK_THROWS(with_markers(with_bos, -1, -1, 2, 100),
                        InvalidAlignmentError);
  SEQBATCH_CHECK(with_markers(Alignment(), -1, -1, 2, 100).bos == -1);
}

void records_not_mutated() {
  Records records = {make_record(0, {5, 6}, Words{7}),
                     make_record(1, {1}, Words{8, 9})};
  Records before = records;

  Alignment alignment;
  alignment.add_bos_x = true;
  alignment.add_bos_y = true;
  Batch first(records, alignment);
  Batch second(records, alignment);

  for (size_t i = 0; i < records.size(); i++) {
    SEQBATCH_CHECK(records[i].x == before[i].x);
    SEQBATCH_CHECK(records[i].y == before[i].y);
  }
  SEQBATCH_CHECK(first.x_seqs() == second.x_seqs());
  SEQBATCH_CHECK(first.y_seqs() == second.y_seqs());
  SEQBATCH_CHECK(first.max_x_len() == 4);
}

void masks() {
  Tensor subsequent = subsequent_mask(3);
  SEQBATCH_CHECK(subsequent.shape() == Shape({3, 3}));
  for (size_t i = 0; i < 3; i++) {
    for (size_t j = 0; j < 3; j++) {
      SEQBATCH_CHECK(subsequent.at<uint8_t>(i, j) == (j <= i ? 1 : 0));
    }
  }

  Records records = {make_record(0, {5}, Words{6, 7, 8}),
                     make_record(1, {5}, Words{9})};
  Batch batch(records, plain());

  Tensor padding = padding_mask(batch.y_seqs(), 0);
  SEQBATCH_CHECK(padding.shape() == Shape({2, 3}));
  SEQBATCH_CHECK((padding.at<uint8_t>(1, 0) == 1));
  SEQBATCH_CHECK((padding.at<uint8_t>(1, 1) == 0));

  Tensor autoreg = batch.y_autoreg_mask();
  SEQBATCH_CHECK(autoreg.shape() == Shape({2, 3, 3}));
  const uint8_t *mask = autoreg.data<uint8_t>();
  auto at = [mask](size_t b, size_t i, size_t j) {
    return mask[b * 9 + i * 3 + j];  // NOLINT
  };
  // Full row: causal only.
  SEQBATCH_CHECK(at(0, 0, 0) == 1 && at(0, 0, 1) == 0);
  SEQBATCH_CHECK(at(0, 2, 0) == 1 && at(0, 2, 1) == 1 && at(0, 2, 2) == 1);
  // Padded row: nothing past the first position, whatever the query.
  SEQBATCH_CHECK(at(1, 2, 0) == 1 && at(1, 2, 1) == 0 && at(1, 2, 2) == 0);
}

void flat_longest_first() {
  TempDir dir;
  std::string path = dir.path("train.tsv");
  write_text(path, "4 4\n4 4 4 4 4\n4 4 4\n");

  FlatFileStore::Config config;
  config.longest_first = true;
  FlatFileStore store(path, config);
  SEQBATCH_CHECK(store.in_mem());
  SEQBATCH_CHECK(store.size() == 3);

  for (size_t pass = 0; pass < 3; pass++) {
    Records records = drain(*store.read());
    SEQBATCH_CHECK(records.size() == 3);
    SEQBATCH_CHECK(records[0].x_len() == 5);
    SEQBATCH_CHECK(records[1].x_len() == 3);
    SEQBATCH_CHECK(records[2].x_len() == 2);
    SEQBATCH_CHECK(!records[0].has_y());
  }
}

void flat_streaming() {
  TempDir dir;
  std::string path = dir.path("train.tsv");
  // Line 2 is too long for max_src_len 3, line 3 has an empty target.
  write_text(path,
             "1 2\t3 4\textra\n"
             "5 6 7 8\t9\n"
             "10\t\n"
             "11 12\t13\r\n"
             "14");

  FlatFileStore::Config config;
  config.lengths.max_src_len = 3;
  FlatFileStore store(path, config);
  SEQBATCH_CHECK(!store.in_mem());
  SEQBATCH_CHECK(store.size() == 5);

  Records records = drain(*store.read());
  SEQBATCH_CHECK(records.size() == 3);
  SEQBATCH_CHECK(records[0].id == 0);
  SEQBATCH_CHECK((records[0].x == Words{1, 2}));
  SEQBATCH_CHECK((*records[0].y == Words{3, 4}));
  SEQBATCH_CHECK(records[1].id == 3);
  SEQBATCH_CHECK((*records[1].y == Words{13}));
  SEQBATCH_CHECK(records[2].id == 4);
  SEQBATCH_CHECK(!records[2].has_y());

  config.lengths.truncate = true;
  FlatFileStore truncated(path, config);
  Records kept = drain(*truncated.read());
  SEQBATCH_CHECK(kept.size() == 4);
  SEQBATCH_CHECK((kept[1].x == Words{5, 6, 7}));

  std::string malformed = dir.path("bad.tsv");
  write_text(malformed, "1 2\t3\n1 two\t3\n");
  FlatFileStore bad(malformed, FlatFileStore::Config());
  auto stream = bad.read();
  SEQBATCH_CHECK(stream->next().has_value());
  SEQBATCH_CHECK_THROWS(stream->next(), MalformedRecordError);
}

void flat_writers() {
  TempDir dir;
  std::string parallel = dir.path("parallel.tsv");
  FlatFileStore::write_parallel({{{1, 2}, Words{3}}, {{4}, std::nullopt}},
                                parallel);
  Records records = drain(*FlatFileStore(parallel, {}).read());
  SEQBATCH_CHECK(records.size() == 2);
  SEQBATCH_CHECK((*records[0].y == Words{3}));
  SEQBATCH_CHECK(!records[1].has_y());

  std::string mono = dir.path("mono.tsv");
  FlatFileStore::write_mono({{5, 6}, {7}}, mono);
  Records lines = drain(*FlatFileStore(mono, {}).read());
  SEQBATCH_CHECK(lines.size() == 2);
  SEQBATCH_CHECK((lines[0].x == Words{5, 6}));
}

void flat_shuffle() {
  TempDir dir;
  std::string path = dir.path("train.tsv");
  std::string text;
  for (size_t i = 0; i < 50; i++) {  // NOLINT
    text += std::to_string(i + 10) + "\t" + std::to_string(i) + "\n";
  }
  write_text(path, text);

  FlatFileStore::Config config;
  config.shuffle = true;
  config.seed = 3;

  auto order = [](FlatFileStore &store) {
    Ids ids;
    for (const Record &record : drain(*store.read())) {
      ids.push_back(record.id);
    }
    return ids;
  };

  FlatFileStore store(path, config);
  SEQBATCH_CHECK(store.in_mem());
  Ids first = order(store);
  Ids second = order(store);
  SEQBATCH_CHECK(first != second);

  Ids sorted = first;
  std::sort(sorted.begin(), sorted.end());
  for (size_t i = 0; i < sorted.size(); i++) {
    SEQBATCH_CHECK(sorted[i] == static_cast<Id>(i));
  }

  // Same seed, same sequence of orders.
  FlatFileStore replay(path, config);
  SEQBATCH_CHECK(order(replay) == first);
  SEQBATCH_CHECK(order(replay) == second);
}

void indexed_roundtrip() {
  TempDir dir;
  std::string path = dir.path("train.db");
  SeqPairs pairs = {{{1, 2, 3}, Words{4}},
                    {{-5}, Words{6, 7}},
                    {{8, 9}, std::nullopt},
                    {{1000000}, Words{-1000000, 0}}};
  IndexedStore::write(path, pairs);
  SEQBATCH_CHECK(std::filesystem::exists(path));

  IndexedStore::Config config;
  config.sort_by = "x_len_asc";
  config.len_rand = 1;
  IndexedStore store(path, config);
  SEQBATCH_CHECK(store.size() == pairs.size());
  SEQBATCH_CHECK(store.supports_projection());

  Records records = drain(*store.read());
  SEQBATCH_CHECK(records.size() == pairs.size());
  for (size_t i = 1; i < records.size(); i++) {
    SEQBATCH_CHECK(records[i - 1].x_len() <= records[i].x_len());
  }

  // Ids follow insertion order, starting at 1.
  Records by_id = store.fetch({1, 2, 3, 4});
  for (size_t i = 0; i < pairs.size(); i++) {
    SEQBATCH_CHECK(by_id[i].id == static_cast<Id>(i + 1));
    SEQBATCH_CHECK(by_id[i].x == pairs[i].first);
    SEQBATCH_CHECK(by_id[i].y == pairs[i].second);
  }

  std::vector<RecordStats> stats = store.stats(Column::y_len, Order::desc);
  SEQBATCH_CHECK(stats.size() == pairs.size());
  // Record 3 has no target: -1 on disk, sorted by its source length.
  auto no_target = std::find_if(stats.begin(), stats.end(),
                                [](const RecordStats &s) { return s.id == 3; });
  SEQBATCH_CHECK(no_target->y_len == -1);
  SEQBATCH_CHECK(no_target->length() == 2);
  SEQBATCH_CHECK(stats.back().id == 1);
}

void indexed_fetch() {
  TempDir dir;
  std::string path = dir.path("train.db");
  SeqPairs pairs;
  for (Word i = 0; i < 1200; i++) {  // NOLINT
    pairs.emplace_back(Words{i}, Words{i, i});
  }
  IndexedStore::write(path, pairs);

  IndexedStore store(path, IndexedStore::Config());
  Ids ids = {1100, 3, 600, 3, 1};
  Records records = store.fetch(ids);
  SEQBATCH_CHECK(records.size() == ids.size());
  for (size_t i = 0; i < ids.size(); i++) {
    SEQBATCH_CHECK(records[i].id == ids[i]);
    SEQBATCH_CHECK(records[i].x == Words{static_cast<Word>(ids[i] - 1)});
  }

  Ids many(1200);
  for (size_t i = 0; i < many.size(); i++) {
    many[i] = static_cast<Id>(many.size() - i);
  }
  Records all = store.fetch(many);
  SEQBATCH_CHECK(all.size() == 1200);
  SEQBATCH_CHECK(all.front().id == 1200);

  SEQBATCH_CHECK_THROWS(store.fetch({1, 5000}), MissingRecordError);
}

void indexed_length_policy() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, {{fill(2), fill(2)},
                             {fill(6), fill(2)},
                             {fill(2), fill(6)},
                             {fill(1), Words()}});

  IndexedStore::Config config;
  config.sort_by = "y_len_desc";
  config.lengths.max_src_len = 4;
  config.lengths.max_tgt_len = 4;
  IndexedStore skipping(path, config);
  // Long records skipped, the empty target dropped.
  SEQBATCH_CHECK(drain(*skipping.read()).size() == 1);
  SEQBATCH_CHECK(skipping.stats(Column::y_len, Order::desc).size() == 2);

  config.lengths.truncate = true;
  IndexedStore truncating(path, config);
  Records records = drain(*truncating.read());
  SEQBATCH_CHECK(records.size() == 3);
  for (const Record &record : records) {
    SEQBATCH_CHECK(record.x_len() <= 4 && record.y_len() <= 4);
  }
  Records fetched = truncating.fetch({2});
  SEQBATCH_CHECK(fetched[0].x_len() == 4);
}

void indexed_errors() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, {{{1}, Words{2}}});

  IndexedStore::Config config;
  config.sort_by = "by_magic";
  SEQBATCH_CHECK_THROWS(IndexedStore(path, config), UnsupportedStrategyError);
  config.sort_by = "x_len_asc";
  config.len_rand = 0;
  SEQBATCH_CHECK_THROWS(IndexedStore(path, config), UnsupportedStrategyError);

  std::string other = dir.path("other.db");
  {
    Database db(other, Database::Mode::create);
    db.execute("CREATE TABLE data (id INTEGER PRIMARY KEY, x BLOB, z BLOB)");
  }
  SEQBATCH_CHECK_THROWS(IndexedStore(other, IndexedStore::Config()),
                        SchemaError);

  std::string empty = dir.path("empty.db");
  {
    Database db(empty, Database::Mode::create);
    db.execute("CREATE TABLE unrelated (id INTEGER)");
  }
  SEQBATCH_CHECK_THROWS(IndexedStore(empty, IndexedStore::Config()),
                        SchemaError);

  SEQBATCH_CHECK_THROWS(
      IndexedStore(dir.path("missing.db"), IndexedStore::Config()),
      std::runtime_error);
}

void indexed_overwrite() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, ladder(3, 2));
  IndexedStore::write(path, {{{1}, Words{2}}});

  IndexedStore store(path, IndexedStore::Config());
  SEQBATCH_CHECK(store.size() == 1);

  size_t leftovers = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir.path(""))) {
    if (entry.path().filename() != "train.db") {
      ++leftovers;
    }
  }
  SEQBATCH_CHECK(leftovers == 0);
}

void indexed_sequential() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, {{fill(2), fill(2)},
                             {fill(2), fill(2)},
                             {fill(2), fill(2)},
                             {fill(2), fill(2)},
                             {fill(2), fill(2)}});

  // A finished stream stays finished.
  IndexedStore store(path, IndexedStore::Config());
  auto stream = store.read();
  SEQBATCH_CHECK(drain(*stream).size() == 5);
  SEQBATCH_CHECK(!stream->next().has_value());
  SEQBATCH_CHECK(!stream->next().has_value());

  BatchIterable iterable(path, budget(4));
  for (size_t pass = 0; pass < 2; pass++) {
    auto batches = iterable.pass();
    std::set<Id> seen;
    size_t count = 0;
    while (std::optional<Batch> batch = batches->next()) {
      SEQBATCH_CHECK(count < 3);
      seen.insert(batch->ids().begin(), batch->ids().end());
      ++count;
    }
    SEQBATCH_CHECK(count == 3);
    SEQBATCH_CHECK((seen == std::set<Id>{1, 2, 3, 4, 5}));
    SEQBATCH_CHECK(!batches->next().has_value());
  }

  LoopingIterable looping(std::make_shared<BatchIterable>(path, budget(4)), 7);
  size_t produced = 0;
  while (looping.next()) {
    ++produced;
  }
  SEQBATCH_CHECK(produced == 7);
}

void cache_duplicate_ids() {
  Records records = {make_record(1, {5}, Words{6}),
                     make_record(2, {5}, Words{6}),
                     make_record(1, {7}, Words{8})};
  auto store = std::make_shared<VectorStore>(records);
  SEQBATCH_CHECK_THROWS(InMemoryCache cache(store), DuplicateIdError);
}

void cache_access() {
  Records records = {make_record(10, {5, 5}, Words{6}),
                     make_record(11, {5}, Words{6, 6, 6}),
                     make_record(12, {5, 5, 5}, std::nullopt),
                     make_record(13, {5}, Words{6, 6, 6})};
  auto store = std::make_shared<VectorStore>(records);

  size_t observed = 0;
  InMemoryCache cache(store, [&observed](size_t count, size_t /*rss_kb*/) {
    observed = count;
  });
  SEQBATCH_CHECK(observed == 4);
  SEQBATCH_CHECK(cache.size() == 4);
  SEQBATCH_CHECK(!cache.supports_projection());

  Records fetched = cache.fetch({13, 10});
  SEQBATCH_CHECK(fetched[0].id == 13 && fetched[1].id == 10);
  SEQBATCH_CHECK_THROWS(cache.fetch({99}), MissingRecordError);

  // Stable: 11 before 13 at equal length; 12 sorts by its source length.
  std::vector<RecordStats> desc = cache.stats(Column::y_len, Order::desc);
  Ids order;
  for (const RecordStats &row : desc) {
    order.push_back(row.id);
  }
  SEQBATCH_CHECK((order == Ids{11, 12, 13, 10}));

  std::vector<RecordStats> asc = cache.stats(Column::x_len, Order::asc);
  SEQBATCH_CHECK(asc.front().id == 11 && asc.back().id == 12);

  SEQBATCH_CHECK(drain(*cache.read()).size() == 4);
}

void cache_snapshot() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, ladder(4, 3));
  auto store = std::make_shared<IndexedStore>(path, IndexedStore::Config());

  std::string snapshot = InMemoryCache::snapshot_path(path);
  SEQBATCH_CHECK(snapshot == dir.path("train.memdb.bin"));

  Ptr<InMemoryCache> built = InMemoryCache::open(store);
  SEQBATCH_CHECK(std::filesystem::exists(snapshot));
  SEQBATCH_CHECK(built->supports_projection());

  Ptr<InMemoryCache> loaded = InMemoryCache::load(snapshot, store);
  SEQBATCH_CHECK(loaded != nullptr);
  SEQBATCH_CHECK(loaded->size() == built->size());
  for (size_t i = 0; i < built->size(); i++) {
    const Record &lhs = built->records()[i];
    const Record &rhs = loaded->records()[i];
    SEQBATCH_CHECK(lhs.id == rhs.id && lhs.x == rhs.x && lhs.y == rhs.y);
  }

  // A snapshot of some other source is ignored.
  auto elsewhere = std::make_shared<VectorStore>(Records(), dir.path("x.tsv"));
  SEQBATCH_CHECK(InMemoryCache::load(snapshot, elsewhere) == nullptr);

  write_text(snapshot, "not a snapshot");
  SEQBATCH_CHECK_THROWS(InMemoryCache::load(snapshot, store),
                        MalformedRecordError);
}

void sequential_budget() {
  Records records;
  const size_t lengths[] = {3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5};
  for (size_t i = 0; i < std::size(lengths); i++) {
    records.push_back(make_record(static_cast<Id>(i), fill(lengths[i]),
                                  fill((lengths[i] + 1) / 2)));
  }
  auto store = std::make_shared<VectorStore>(records);

  const size_t max_tokens = 12;
  BatchIterable iterable(store, budget(max_tokens));
  SEQBATCH_CHECK(iterable.num_items() == records.size());
  SEQBATCH_CHECK(iterable.num_batches() == 1);

  std::vector<Batch> batches = drain(*iterable.pass());
  Ids seen;
  for (const Batch &batch : batches) {
    size_t longest = std::max(batch.max_x_len(), batch.max_y_len());
    SEQBATCH_CHECK(batch.size() * longest <= max_tokens);
    seen.insert(seen.end(), batch.ids().begin(), batch.ids().end());
  }

  // Store order, nothing lost, nothing repeated.
  SEQBATCH_CHECK(seen.size() == records.size());
  for (size_t i = 0; i < seen.size(); i++) {
    SEQBATCH_CHECK(seen[i] == static_cast<Id>(i));
  }

  // [3,1,4] -> 3 * 4 = 12; 1 would make 4 * 4 = 16.
  SEQBATCH_CHECK((batches[0].ids() == Ids{0, 1, 2}));
}

void sequential_overflow() {
  Records records = {make_record(0, fill(2), fill(2)),
                     make_record(1, fill(3), fill(7))};
  auto store = std::make_shared<VectorStore>(records);
  BatchIterable iterable(store, budget(6));
  auto pass = iterable.pass();
  SEQBATCH_CHECK_THROWS(pass->next(), BatchOverflowError);
}

void sequential_skips_empty() {
  Records records = {make_record(0, fill(2), fill(2)),
                     make_record(1, fill(2), Words()),
                     make_record(2, fill(2), fill(2))};
  auto store = std::make_shared<VectorStore>(records);
  BatchIterable iterable(store, budget(100));
  std::vector<Batch> batches = drain(*iterable.pass());
  SEQBATCH_CHECK(batches.size() == 1);
  SEQBATCH_CHECK((batches[0].ids() == Ids{0, 2}));
}

void eq_len_batches() {
  TempDir dir;
  std::string path = dir.path("train.db");
  SeqPairs pairs = ladder(10, 20);
  IndexedStore::write(path, pairs);

  const size_t max_tokens = 20;
  BatchIterable::Config config = budget(max_tokens);
  config.sort_by = BatchIterable::kEqLenRandBatch;
  config.len_rand = 1;
  config.seed = 7;

  BatchIterable iterable(path, config);
  auto order = [&iterable, max_tokens]() {
    std::vector<Batch> batches = drain(*iterable.pass());
    std::vector<Ids> ids;
    std::set<Id> seen;
    for (const Batch &batch : batches) {
      const std::vector<size_t> &y_len = batch.y_len();
      auto [shortest, longest] = std::minmax_element(y_len.begin(), y_len.end());
      SEQBATCH_CHECK(batch.size() * *longest <= max_tokens);
      SEQBATCH_CHECK(*longest - *shortest <= 1);
      seen.insert(batch.ids().begin(), batch.ids().end());
      ids.push_back(batch.ids());
    }
    SEQBATCH_CHECK(seen.size() == 200);
    return ids;
  };

  std::vector<Ids> first = order();
  std::vector<Ids> second = order();
  SEQBATCH_CHECK(first != second);

  // Same seed, same store: same batches in the same order.
  BatchIterable replay(path, config);
  std::vector<Batch> replayed = drain(*replay.pass());
  SEQBATCH_CHECK(replayed.size() == first.size());
  for (size_t i = 0; i < replayed.size(); i++) {
    SEQBATCH_CHECK(replayed[i].ids() == first[i]);
  }
}

void eq_len_unsupported() {
  TempDir dir;
  std::string path = dir.path("train.tsv");
  write_text(path, "1\t2\n");

  BatchIterable::Config config = budget(10);
  config.sort_by = BatchIterable::kEqLenRandBatch;
  SEQBATCH_CHECK_THROWS(BatchIterable(path, config), UnsupportedStrategyError);

  // The cache keeps the capability of the store it wraps.
  auto flat = std::make_shared<FlatFileStore>(path, FlatFileStore::Config());
  auto cache = std::make_shared<InMemoryCache>(flat);
  SEQBATCH_CHECK_THROWS(BatchIterable(cache, config), UnsupportedStrategyError);

  SEQBATCH_CHECK_THROWS(BatchIterable(dir.path("nope.tsv"), budget(10)),
                        std::runtime_error);
}

void eq_len_empty() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, {{fill(2), Words()}});

  BatchIterable::Config config = budget(10);
  config.sort_by = BatchIterable::kEqLenRandBatch;
  BatchIterable iterable(path, config);
  SEQBATCH_CHECK_THROWS(iterable.pass(), EmptyDatasetError);
}

void keep_in_mem() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, ladder(5, 4));

  BatchIterable::Config config = budget(10);
  config.keep_in_mem = true;
  config.sort_by = BatchIterable::kEqLenRandBatch;
  BatchIterable iterable(path, config);
  SEQBATCH_CHECK(std::filesystem::exists(dir.path("train.memdb.bin")));
  SEQBATCH_CHECK(iterable.num_items() == 20);

  size_t count = 0;
  for (const Batch &batch : drain(*iterable.pass())) {
    count += batch.size();
  }
  SEQBATCH_CHECK(count == 20);

  // Second open restores from the snapshot.
  BatchIterable restored(path, config);
  SEQBATCH_CHECK(restored.num_items() == 20);
}

void looping() {
  Records records;
  for (Id id = 0; id < 5; id++) {
    records.push_back(make_record(id, fill(2), fill(2)));
  }
  auto store = std::make_shared<VectorStore>(records);
  auto iterable = std::make_shared<BatchIterable>(store, budget(4));

  LoopingIterable loop(iterable, 7);
  std::vector<Ids> seen;
  while (std::optional<Batch> batch = loop.next()) {
    seen.push_back(batch->ids());
  }

  SEQBATCH_CHECK(seen.size() == 7);
  SEQBATCH_CHECK(loop.count() == 7);
  const std::vector<Ids> cycle = {{0, 1}, {2, 3}, {4}};
  for (size_t i = 0; i < seen.size(); i++) {
    SEQBATCH_CHECK(seen[i] == cycle[i % cycle.size()]);
  }
  SEQBATCH_CHECK(!loop.next().has_value());

  loop.reset();
  SEQBATCH_CHECK(loop.count() == 0);
  std::optional<Batch> again = loop.next();
  SEQBATCH_CHECK(again.has_value() && again->ids() == cycle[0]);
}

void looping_empty() {
  Records records = {make_record(0, Words(), Words{1})};
  auto store = std::make_shared<VectorStore>(records);
  auto iterable = std::make_shared<BatchIterable>(store, budget(4));
  LoopingIterable loop(iterable, 3);
  SEQBATCH_CHECK_THROWS(loop.next(), EmptyDatasetError);
}

void looping_eq_len() {
  TempDir dir;
  std::string path = dir.path("train.db");
  IndexedStore::write(path, ladder(4, 10));

  BatchIterable::Config config = budget(8);
  config.sort_by = BatchIterable::kEqLenRandBatch;
  config.len_rand = 1;
  config.seed = 11;

  // Bucket sizes do not depend on the seed, only their order does.
  BatchIterable counting(path, config);
  size_t per_pass = drain(*counting.pass()).size();
  SEQBATCH_CHECK(per_pass > 2);

  LoopingIterable looping(std::make_shared<BatchIterable>(path, config),
                          2 * per_pass);
  std::vector<Ids> batches;
  while (std::optional<Batch> batch = looping.next()) {
    batches.push_back(batch->ids());
  }
  SEQBATCH_CHECK(batches.size() == 2 * per_pass);

  std::vector<Ids> first(batches.begin(), batches.begin() + per_pass);
  std::vector<Ids> second(batches.begin() + per_pass, batches.end());
  SEQBATCH_CHECK(first != second);
  for (const std::vector<Ids> &pass : {first, second}) {
    std::set<Id> seen;
    for (const Ids &ids : pass) {
      seen.insert(ids.begin(), ids.end());
    }
    SEQBATCH_CHECK(seen.size() == 40);
  }
}

void preprocess_parallel() {
  TempDir dir;
  std::string src = dir.path("train.src");
  std::string tgt = dir.path("train.tgt");
  std::string src_text;
  std::string tgt_text;
  for (size_t i = 0; i < 50; i++) {  // NOLINT
    // Every 10th pair is too long on the source side, every 7th empty.
    size_t length = (i % 10 == 9) ? 12 : 1 + i % 4;
    std::string line;
    for (size_t j = 0; j < length; j++) {
      line += std::to_string(i) + " ";
    }
    src_text += (i % 7 == 6) ? "  \n" : line + "\n";
    tgt_text += std::to_string(i) + "\n";
  }
  write_text(src, src_text);
  write_text(tgt, tgt_text);

  Preprocessor::Config config;
  config.workers = 3;
  config.lengths.max_src_len = 8;
  Preprocessor preprocessor(Preprocessor::integers(), Preprocessor::integers(),
                            config);

  SeqPairs pairs = preprocessor.process(src, tgt);
  size_t expected = 0;
  Word previous = -1;
  for (size_t i = 0; i < 50; i++) {  // NOLINT
    if (i % 10 != 9 && i % 7 != 6) {
      ++expected;
    }
  }
  SEQBATCH_CHECK(pairs.size() == expected);
  for (const auto &[x, y] : pairs) {
    SEQBATCH_CHECK(x.size() <= 8);
    SEQBATCH_CHECK(x.front() == y->front());
    // Input order is kept.
    SEQBATCH_CHECK(x.front() > previous);
    previous = x.front();
  }

  std::string out = dir.path("train.db");
  SEQBATCH_CHECK(preprocessor.prepare(src, tgt, out) == expected);
  IndexedStore store(out, IndexedStore::Config());
  SEQBATCH_CHECK(store.size() == expected);

  config.lengths.truncate = true;
  Preprocessor truncating(Preprocessor::integers(), Preprocessor::integers(),
                          config);
  std::string flat = dir.path("train.tsv");
  size_t written = truncating.prepare(src, tgt, flat);
  SEQBATCH_CHECK(written == 50 - 7);  // NOLINT
  SEQBATCH_CHECK(FlatFileStore(flat, {}).size() == written);
}

void preprocess_mismatch() {
  TempDir dir;
  std::string src = dir.path("train.src");
  std::string tgt = dir.path("train.tgt");
  write_text(src, "1\n2\n3\n");
  write_text(tgt, "1\n2\n");

  Preprocessor preprocessor(Preprocessor::integers(), Preprocessor::integers(),
                            Preprocessor::Config());
  std::string out = dir.path("train.db");
  SEQBATCH_CHECK_THROWS(preprocessor.prepare(src, tgt, out),
                        CorpusMismatchError);
  SEQBATCH_CHECK(!std::filesystem::exists(out));
}

void preprocess_worker_error() {
  TempDir dir;
  std::string src = dir.path("train.src");
  std::string tgt = dir.path("train.tgt");
  write_text(src, "1 2\n3 four\n5\n6\n");
  write_text(tgt, "1\n2\n3\n4\n");

  Preprocessor::Config config;
  config.workers = 2;
  Preprocessor preprocessor(Preprocessor::integers(), Preprocessor::integers(),
                            config);
  SEQBATCH_CHECK_THROWS(preprocessor.process(src, tgt), MalformedRecordError);
}

void preprocess_mono() {
  TempDir dir;
  std::string path = dir.path("mono.txt");
  write_text(path, "1 2 3\n\n4 5 6 7 8\n9\n");

  Preprocessor::Config config;
  config.lengths.max_src_len = 4;
  Preprocessor preprocessor(Preprocessor::integers(), Preprocessor::integers(),
                            config);
  std::vector<Words> lines = preprocessor.process_mono(path);
  SEQBATCH_CHECK(lines.size() == 2);
  SEQBATCH_CHECK((lines[1] == Words{9}));

  std::string out = dir.path("mono.db");
  SEQBATCH_CHECK(preprocessor.prepare_mono(path, out) == 2);
  IndexedStore store(out, IndexedStore::Config());
  Records records = store.fetch({1, 2});
  SEQBATCH_CHECK(!records[0].has_y());
  SEQBATCH_CHECK((records[0].x == Words{1, 2, 3}));
}

}  // namespace seqbatch

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <test-name>\n";
    std::exit(EXIT_FAILURE);
  }

// clang-format off
#define TEST_ENTRY(fn_name) {#fn_name, &seqbatch::fn_name}
  // clang-format on

  using Test = void (*)();
  std::unordered_map<std::string, Test> tests({
      TEST_ENTRY(blob_codec),               //
      TEST_ENTRY(parse_words),              //
      TEST_ENTRY(augment_idempotent),       //
      TEST_ENTRY(batch_example),            //
      TEST_ENTRY(batch_rows),               //
      TEST_ENTRY(batch_time_first),         //
      TEST_ENTRY(batch_sort_desc),          //
      TEST_ENTRY(batch_alignment_errors),   //
      TEST_ENTRY(alignment_markers),        //
      TEST_ENTRY(records_not_mutated),      //
      TEST_ENTRY(masks),                    //
      TEST_ENTRY(flat_longest_first),       //
      TEST_ENTRY(flat_streaming),           //
      TEST_ENTRY(flat_writers),             //
      TEST_ENTRY(flat_shuffle),             //
      TEST_ENTRY(indexed_roundtrip),        //
      TEST_ENTRY(indexed_fetch),            //
      TEST_ENTRY(indexed_length_policy),    //
      TEST_ENTRY(indexed_errors),           //
      TEST_ENTRY(indexed_overwrite),        //
      TEST_ENTRY(indexed_sequential),       //
      TEST_ENTRY(cache_duplicate_ids),      //
      TEST_ENTRY(cache_access),             //
      TEST_ENTRY(cache_snapshot),           //
      TEST_ENTRY(sequential_budget),        //
      TEST_ENTRY(sequential_overflow),      //
      TEST_ENTRY(sequential_skips_empty),   //
      TEST_ENTRY(eq_len_batches),           //
      TEST_ENTRY(eq_len_unsupported),       //
      TEST_ENTRY(eq_len_empty),             //
      TEST_ENTRY(keep_in_mem),              //
      TEST_ENTRY(looping),                  //
      TEST_ENTRY(looping_empty),            //
      TEST_ENTRY(looping_eq_len),           //
      TEST_ENTRY(preprocess_parallel),      //
      TEST_ENTRY(preprocess_mismatch),      //
      TEST_ENTRY(preprocess_worker_error),  //
      TEST_ENTRY(preprocess_mono)           //
  });

  std::string test = argv[1];

  auto query = tests.find(test);
  if (query != tests.end()) {
    auto name = query->first;
    auto fn = query->second;
    try {
      std::cout << "Running test [" << name << "] ...";
      fn();
      std::cout << " [success]\n";
    } catch (const std::exception &exception) {
      std::cout << " [fail] " << exception.what() << "\n";
      return EXIT_FAILURE;
    }
  } else if (test == "all") {
    std::vector<std::string> failed;
    for (auto &named_test : tests) {
      auto name = named_test.first;
      auto fn = named_test.second;
      try {
        std::cout << "Running test ... ";
        fn();
        std::cout << "[success] [" << name << "]\n";
      } catch (const std::exception &exception) {
        std::cout << " [fail] [" << name << "] " << exception.what() << "\n";
        failed.push_back(name);
      }
    }
    if (!failed.empty()) {
      return EXIT_FAILURE;
    }
  } else {
    std::cerr << "Unknown test " << test << "\n";
    std::exit(EXIT_FAILURE);
  }
  return 0;
}
