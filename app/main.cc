#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <CLI/CLI.hpp>

#include "seqbatch/seqbatch.hh"

namespace {

using namespace seqbatch;  // NOLINT

struct PrepareOptions {
  std::string src;
  std::string tgt;
  std::string out;
  std::string src_vocab;
  std::string tgt_vocab;
  Preprocessor::Config preprocessor;

  template <class App>
  void setup_onto(App &app) {
    // clang-format off
    app.add_option("--src", src, "Source side raw corpus, one sentence per line.")->required();
    app.add_option("--tgt", tgt, "Target side raw corpus, line-aligned with --src. Omit for monolingual data.");
    app.add_option("--out", out, "Store to write: .db for an indexed store, anything else for a flat file.")->required();
    app.add_option("--src-vocab", src_vocab, "SentencePiece model for the source side. Without one, lines must be integer ids.");
    app.add_option("--tgt-vocab", tgt_vocab, "SentencePiece model for the target side. Defaults to --src-vocab.");
    preprocessor.setup_onto(app);
    // clang-format on
  }
};

struct BatchesOptions {
  std::string data;
  std::string vocab;
  size_t steps = 0;
  bool show = false;
  BatchIterable::Config iterable;

  template <class App>
  void setup_onto(App &app) {
    // clang-format off
    app.add_option("--data", data, "Store to read batches from.")->required();
    app.add_option("--vocab", vocab, "SentencePiece model the store was prepared with. Its pad, bos and eos ids replace the defaults of --pad, --bos and --eos.");
    app.add_option("--steps", steps, "Number of batches to produce, looping over the data. 0 for a single pass.");
    app.add_flag("--show", show, "Print the padded matrices of every batch.");
    iterable.setup_onto(app);
    // clang-format on
  }
};

struct InspectOptions {
  std::string data;
  BatchIterable::Config iterable;

  template <class App>
  void setup_onto(App &app) {
    // clang-format off
    app.add_option("--data", data, "Store to inspect.")->required();
    app.add_option("--max-tokens", iterable.max_tokens, "Token budget used for the batch count estimate.");
    app.add_option("--max-src-len", iterable.lengths.max_src_len, "Longest source sequence kept.");
    app.add_option("--max-tgt-len", iterable.lengths.max_tgt_len, "Longest target sequence kept.");
    // clang-format on
  }
};

Preprocessor::Tokenizer tokenizer(const std::string &vocab) {
  if (vocab.empty()) {
    return Preprocessor::integers();
  }
  auto vocabulary = std::make_shared<Vocabulary>(vocab);
  LOG(info, "Loaded %s: %zu pieces, pad=%d bos=%d eos=%d", vocab.c_str(),
      vocabulary->size(), vocabulary->pad_id(), vocabulary->bos_id(),
      vocabulary->eos_id());
  return [vocabulary](std::string_view line) {
    return vocabulary->encode(line);
  };
}

void prepare(const PrepareOptions &options) {
  const std::string &tgt_vocab =
      options.tgt_vocab.empty() ? options.src_vocab : options.tgt_vocab;
  Preprocessor preprocessor(tokenizer(options.src_vocab), tokenizer(tgt_vocab),
                            options.preprocessor);

  size_t count = options.tgt.empty()
                     ? preprocessor.prepare_mono(options.src, options.out)
                     : preprocessor.prepare(options.src, options.tgt,
                                            options.out);
  fprintf(stdout, "%zu records written to %s\n", count, options.out.c_str());
}

void report(size_t index, const Batch &batch, bool show) {
  // clang-format off
  fprintf(stdout, "%zu\tsize=%zu\tx_toks=%zu\ty_toks=%zu\tmax_x_len=%zu\tmax_y_len=%zu\n",
          index, batch.size(), batch.x_toks(), batch.y_toks(), batch.max_x_len(), batch.max_y_len());
  // clang-format on
  if (show) {
    const Tensor &x = batch.x_seqs();
    print_ndarray(std::cout, x.data<int32_t>(), x.shape().dims()) << "\n";
    if (batch.has_y()) {
      const Tensor &y = batch.y_seqs();
      print_ndarray(std::cout, y.data<int32_t>(), y.shape().dims()) << "\n";
    }
  }
}

// Marker ids given on the command line win over those of --vocab.
Alignment alignment(const BatchesOptions &options, const CLI::App &app) {
  Alignment given = options.iterable.alignment;
  if (options.vocab.empty()) {
    return given;
  }

  Vocabulary vocabulary(options.vocab);
  Word pad = app.count("--pad") > 0 ? given.pad : vocabulary.pad_id();
  Word bos = app.count("--bos") > 0 ? given.bos : vocabulary.bos_id();
  Word eos = app.count("--eos") > 0 ? given.eos : vocabulary.eos_id();
  Alignment resolved = with_markers(given, pad, bos, eos, vocabulary.size());
  LOG(info, "Markers from %s: pad=%d bos=%d eos=%d", options.vocab.c_str(),
      resolved.pad, resolved.bos, resolved.eos);
  return resolved;
}

void batches(const BatchesOptions &options, const CLI::App &app) {
  BatchIterable::Config config = options.iterable;
  config.alignment = alignment(options, app);
  auto iterable = std::make_shared<BatchIterable>(options.data, config);
  fprintf(stdout, "items=%zu\tbatches~%zu\n", iterable->num_items(),
          iterable->num_batches());

  size_t index = 0;
  if (options.steps == 0) {
    std::unique_ptr<BatchStream> pass = iterable->pass();
    while (std::optional<Batch> batch = pass->next()) {
      report(index++, *batch, options.show);
    }
    return;
  }

  LoopingIterable looping(iterable, options.steps);
  while (std::optional<Batch> batch = looping.next()) {
    report(index++, *batch, options.show);
  }
}

void inspect(const InspectOptions &options) {
  BatchIterable::Config config = options.iterable;
  Ptr<Store> store = BatchIterable::open(options.data, config);
  BatchIterable iterable(store, config);

  size_t count = 0;
  size_t with_y = 0;
  size_t x_toks = 0;
  size_t y_toks = 0;
  size_t max_x_len = 0;
  size_t max_y_len = 0;

  std::unique_ptr<RecordStream> stream = store->read();
  while (std::optional<Record> record = stream->next()) {
    ++count;
    x_toks += record->x_len();
    max_x_len = std::max(max_x_len, record->x_len());
    if (record->has_y()) {
      ++with_y;
      y_toks += record->y_len();
      max_y_len = std::max(max_y_len, record->y_len());
    }
  }

  auto mean = [](size_t total, size_t n) {
    return n == 0 ? 0.0 : static_cast<double>(total) / static_cast<double>(n);
  };

  // clang-format off
  fprintf(stdout, "path: %s\n", store->path().c_str());
  fprintf(stdout, "items: %zu\n", iterable.num_items());
  fprintf(stdout, "readable: %zu\n", count);
  fprintf(stdout, "with target: %zu\n", with_y);
  fprintf(stdout, "x_len: mean %.2lf max %zu\n", mean(x_toks, count), max_x_len);
  fprintf(stdout, "y_len: mean %.2lf max %zu\n", mean(y_toks, with_y), max_y_len);
  fprintf(stdout, "batches at %zu toks: ~%zu\n", config.max_tokens, iterable.num_batches());
  fprintf(stdout, "projection: %s\n", stringify(store->supports_projection()));
  fprintf(stdout, "peak memory: %s\n", format_kb(max_rss_kb()).c_str());
  // clang-format on
}

}  // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"seqbatch"};
  app.require_subcommand(1);

  PrepareOptions prepare_options;
  CLI::App *prepare_app =
      app.add_subcommand("prepare", "Tokenize raw corpora into a store.");
  prepare_options.setup_onto(*prepare_app);

  BatchesOptions batches_options;
  CLI::App *batches_app =
      app.add_subcommand("batches", "Produce batches from a store.");
  batches_options.setup_onto(*batches_app);

  InspectOptions inspect_options;
  CLI::App *inspect_app =
      app.add_subcommand("inspect", "Print statistics of a store.");
  inspect_options.setup_onto(*inspect_app);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    return app.exit(e);
  }

  try {
    if (prepare_app->parsed()) {
      prepare(prepare_options);
    } else if (batches_app->parsed()) {
      batches(batches_options, *batches_app);
    } else if (inspect_app->parsed()) {
      inspect(inspect_options);
    }
  } catch (const std::exception &e) {
    LOG(error, "%s", e.what());
    return EXIT_FAILURE;
  }

  return 0;
}
