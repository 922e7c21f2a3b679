#include "test_framework.hpp"

#include "newsdesk/engine/engine.hpp"
#include "newsdesk/observability/observer.hpp"
#include "newsdesk/persistence/manifest.hpp"
#include "newsdesk/persistence/tar.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>

namespace {

namespace fs = std::filesystem;
namespace en = newsdesk::engine;
namespace ix = newsdesk::index;
namespace obs = newsdesk::observability;
namespace t = newsdesk::testing;
using newsdesk::common::ErrorCode;
using newsdesk::tests::require;

struct Harness {
  t::TempWorkspace ws;
  t::ManualClock clock;
  std::shared_ptr<t::CountingEmbedder> embedder;
  std::shared_ptr<t::ScriptedProvider> chat = std::make_shared<t::ScriptedProvider>();
  newsdesk::config::Config config;
  std::unique_ptr<en::Engine> engine;

  explicit Harness(const std::function<void(newsdesk::config::Config &)> &adjust = {},
                   std::string model_id = "")
      : embedder(std::make_shared<t::CountingEmbedder>(64, std::move(model_id))),
        config(t::mock_config(ws.path() / "index")) {
    if (adjust) {
      adjust(config);
    }
    auto created = en::Engine::create(config, dependencies());
    require(created.ok(), created.error());
    engine = std::move(created.value());
  }

  [[nodiscard]] en::EngineDependencies dependencies() {
    return en::EngineDependencies{.embedder = embedder,
                                  .chat_provider = chat,
                                  .wall_clock = clock.wall(),
                                  .steady_clock = clock.steady()};
  }

  std::string ingest(const std::string &text, const std::string &category) {
    auto id = engine->ingest(ix::DocumentInput{.text = text,
                                               .category = category,
                                               .source_url = "https://news.example.com/" + category,
                                               .title = std::nullopt});
    require(id.ok(), id.error());
    return id.value();
  }
};

ix::DocumentInput doc(const std::string &text, const std::string &category) {
  return ix::DocumentInput{.text = text, .category = category, .source_url = std::nullopt,
                           .title = std::nullopt};
}

std::vector<ix::DocumentInput> numbered(const std::string &category, const std::size_t count,
                                        const std::string &topic) {
  std::vector<ix::DocumentInput> out;
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(doc(topic + " report number " + std::to_string(i) + " for " + category, category));
  }
  return out;
}

void small_chunks(newsdesk::config::Config &config) {
  config.retrieval.chunk_size = 200;
  config.retrieval.chunk_overlap = 40;
}

void three_categories(newsdesk::config::Config &config) {
  config.taxonomy.categories = {"Business", "RealEstate", "Technology"};
}

} // namespace

void register_engine_tests(std::vector<newsdesk::tests::TestCase> &tests) {
  tests.push_back({"engine_create_rejects_bad_configuration", [] {
                     t::TempWorkspace ws;
                     auto deps = [] {
                       return en::EngineDependencies{
                           .embedder = std::make_shared<t::CountingEmbedder>(),
                           .chat_provider = std::make_shared<t::ScriptedProvider>()};
                     };

                     auto overlap = t::mock_config(ws.path());
                     overlap.retrieval.chunk_overlap = overlap.retrieval.chunk_size;
                     require(en::Engine::create(overlap, deps()).code() ==
                                 ErrorCode::ConfigurationError,
                             "overlap");

                     auto empty_taxonomy = t::mock_config(ws.path());
                     empty_taxonomy.taxonomy.categories.clear();
                     require(en::Engine::create(empty_taxonomy, deps()).code() ==
                                 ErrorCode::ConfigurationError,
                             "empty taxonomy");

                     auto no_embedder = deps();
                     no_embedder.embedder.reset();
                     require(en::Engine::create(t::mock_config(ws.path()), no_embedder).code() ==
                                 ErrorCode::ConfigurationError,
                             "embedder required");

                     auto no_chat = deps();
                     no_chat.chat_provider.reset();
                     require(en::Engine::create(t::mock_config(ws.path()), no_chat).code() ==
                                 ErrorCode::ConfigurationError,
                             "chat provider required");

                     auto no_key = t::mock_config(ws.path());
                     no_key.api_key.reset();
                     require(en::Engine::create(no_key).code() == ErrorCode::ConfigurationError,
                             "api key required");
                   }});

  tests.push_back({"engine_create_records_config_warnings", [] {
                     t::ScopedRecorder recorder;
                     Harness h([](newsdesk::config::Config &config) {
                       config.retrieval.context_max_chars = 100;
                     });
                     const auto warnings = recorder.events().of<obs::WarningEvent>();
                     require(warnings.size() == 1, "one warning");
                     require(warnings[0].component == "config", "component");
                   }});

  tests.push_back({"engine_create_from_config_uses_local_hash", [] {
                     t::TempWorkspace ws;
                     auto created = en::Engine::create(t::mock_config(ws.path()));
                     require(created.ok(), created.error());
                     const auto status = created.value()->status();
                     require(status.embedding_model == "local-hash-384", "model");
                     require(status.dimensions == 384, "dimensions");
                     require(!status.loaded, "nothing loaded");
                   }});

  tests.push_back({"engine_status_of_fresh_instance", [] {
                     Harness h;
                     const auto status = h.engine->status();
                     require(!status.loaded, "not loaded");
                     require(status.document_count == 0 && status.vector_count == 0, "empty");
                     require(!status.backup_complete, "no backup");
                     require(!status.active_snapshot.has_value(), "no snapshot");
                     require(status.size_bytes == 0, "no bytes");
                     require(status.embedding_model == "local-hash-64", "embedding model");
                     require(status.dimensions == 64, "dimensions");
                     require(status.chat_model == "gpt-4o-mini", "chat model");
                     require(status.taxonomy.size() == 9, "default taxonomy");
                   }});

  tests.push_back({"engine_ingest_is_idempotent", [] {
                     t::ScopedRecorder recorder;
                     Harness h;
                     const auto first = h.engine->ingest(ix::DocumentInput{
                         .text = "Article A", .category = "Business", .source_url = "http://x/1"});
                     require(first.ok(), first.error());
                     const auto embedded = h.embedder->texts_embedded();
                     const auto second = h.engine->ingest(ix::DocumentInput{
                         .text = "  Article A  ", .category = "Business", .source_url = "http://x/1"});
                     require(second.ok(), second.error());
                     require(first.value() == second.value(), "same id");
                     require(h.embedder->texts_embedded() == embedded, "not embedded again");

                     const auto state = h.engine->snapshot();
                     require(state->documents.size() == 1, "one document");
                     require(state->vectors.size() == 1, "one vector");

                     const auto ingests = recorder.events().of<obs::IngestEvent>();
                     require(ingests.size() == 2, "two ingest events");
                     require(!ingests[0].duplicate && ingests[1].duplicate, "duplicate flagged");
                     require(recorder.events().of<obs::IndexPublishedEvent>().size() == 1,
                             "duplicate does not republish");
                   }});

  tests.push_back({"engine_ingest_normalizes_document", [] {
                     Harness h;
                     auto id = h.engine->ingest(ix::DocumentInput{.text = "  Rates hold steady ",
                                                                  .category = " Markets ",
                                                                  .source_url = "  ",
                                                                  .title = " Fed day "});
                     require(id.ok(), id.error());
                     const auto *stored = h.engine->snapshot()->documents.get(id.value());
                     require(stored != nullptr, "stored");
                     require(stored->text == "Rates hold steady", "text trimmed");
                     require(stored->category == "Markets", "category trimmed");
                     require(!stored->source_url.has_value(), "blank url dropped");
                     require(stored->title == std::optional<std::string>("Fed day"), "title");
                     require(stored->ingested_at == "2026-01-01T00:00:00Z", "wall clock");
                   }});

  tests.push_back({"engine_ingest_rejects_bad_input", [] {
                     Harness h;
                     require(h.engine->ingest(doc("   ", "Markets")).code() ==
                                 ErrorCode::InvalidArgument,
                             "empty text");
                     require(h.engine->ingest(doc("Match report", "Sports")).code() ==
                                 ErrorCode::InvalidArgument,
                             "unknown category");
                     require(h.embedder->calls() == 0, "nothing embedded");
                     require(h.engine->snapshot()->size() == 0, "nothing stored");
                   }});

  tests.push_back({"engine_ingest_propagates_provider_failure", [] {
                     t::ScopedRecorder recorder;
                     Harness h;
                     h.embedder->set_failing(true);
                     require(h.engine->ingest(doc("Rates rise", "Markets")).code() ==
                                 ErrorCode::ProviderUnavailable,
                             "provider down");
                     require(h.engine->snapshot()->size() == 0, "nothing stored");
                     require(!recorder.events().of<obs::ErrorEvent>().empty(), "error recorded");

                     h.embedder->set_failing(false);
                     h.embedder->set_wrong_dimensions(true);
                     require(h.engine->ingest(doc("Rates fall", "Markets")).code() ==
                                 ErrorCode::ProviderUnavailable,
                             "wrong dimensions");
                     require(h.engine->snapshot()->size() == 0, "still nothing stored");
                   }});

  tests.push_back({"engine_ingest_article_splits_into_chunks", [] {
                     Harness h(small_chunks);
                     std::string body;
                     for (int i = 0; i < 60; ++i) {
                       body += "word" + std::to_string(i) + (i % 8 == 7 ? ". " : " ");
                     }
                     const ix::ArticleInput article{.body = body,
                                                    .category = "Technology",
                                                    .url = "https://news.example.com/chips",
                                                    .title = "Chip output"};
                     auto ids = h.engine->ingest_article(article);
                     require(ids.ok(), ids.error());
                     require(ids.value().size() >= 2, "several chunks");

                     const auto state = h.engine->snapshot();
                     for (std::size_t i = 0; i < ids.value().size(); ++i) {
                       const auto *chunk = state->documents.get(ids.value()[i]);
                       require(chunk != nullptr, "chunk stored");
                       require(chunk->chunk_index == i, "chunk index");
                       require(chunk->text.size() <= 200, "chunk size");
                       require(chunk->title == std::optional<std::string>("Chip output"), "title");
                     }

                     const auto embedded = h.embedder->texts_embedded();
                     auto again = h.engine->ingest_article(article);
                     require(again.ok(), again.error());
                     require(again.value() == ids.value(), "same ids");
                     require(h.embedder->texts_embedded() == embedded, "nothing re-embedded");

                     require(h.engine
                                 ->ingest_article(ix::ArticleInput{.body = " \n ",
                                                                   .category = "Technology"})
                                 .code() == ErrorCode::InvalidArgument,
                             "empty body");
                   }});

  tests.push_back({"engine_build_index_replace_and_incremental", [] {
                     Harness h;
                     auto first = h.engine->build_index(
                         {doc("Oil climbs", "Markets"), doc("Bank merger", "Business"),
                          doc("Rent index", "RealEstate")},
                         en::BuildMode::Replace);
                     require(first.ok(), first.error());
                     require(first.value().added == 3 && first.value().total == 3, "first build");
                     require(first.value().removed == 0, "nothing removed");

                     const auto embedded = h.embedder->texts_embedded();
                     auto replaced = h.engine->build_index(
                         {doc("Oil climbs", "Markets"), doc("Chip tariffs", "Technology"),
                          doc("Chip tariffs", "Technology")},
                         en::BuildMode::Replace);
                     require(replaced.ok(), replaced.error());
                     require(replaced.value().added == 2, "two unique documents");
                     require(replaced.value().duplicates == 1, "in-batch duplicate");
                     require(replaced.value().removed == 3, "previous documents replaced");
                     require(replaced.value().total == 2, "total");
                     require(h.embedder->texts_embedded() == embedded + 1, "kept vector reused");

                     auto added = h.engine->build_index(
                         {doc("Chip tariffs", "Technology"), doc("Court ruling", "Law")},
                         en::BuildMode::Incremental);
                     require(added.ok(), added.error());
                     require(added.value().added == 1 && added.value().duplicates == 1, "incremental");
                     require(added.value().total == 3, "grown");
                     const auto state = h.engine->snapshot();
                     require(state->documents.size() == state->vectors.size(), "consistent");
                   }});

  tests.push_back({"engine_failed_build_leaves_index_unchanged", [] {
                     Harness h;
                     h.ingest("Oil climbs", "Markets");
                     const auto before = h.engine->snapshot();

                     h.embedder->set_failing(true);
                     auto failed = h.engine->build_index(
                         {doc("Bank merger", "Business"), doc("Rent index", "RealEstate")},
                         en::BuildMode::Replace);
                     require(failed.code() == ErrorCode::ProviderUnavailable, "provider down");
                     require(h.engine->snapshot() == before, "same state published");

                     h.embedder->set_failing(false);
                     const auto calls = h.embedder->calls();
                     auto invalid = h.engine->build_index(
                         {doc("Bank merger", "Business"), doc("Derby", "Sports")},
                         en::BuildMode::Incremental);
                     require(invalid.code() == ErrorCode::InvalidArgument, "bad category");
                     require(h.embedder->calls() == calls, "validated before embedding");
                     require(h.engine->snapshot() == before, "still the same state");
                   }});

  tests.push_back({"engine_remove_document", [] {
                     Harness h;
                     const auto id = h.ingest("Oil climbs on supply cuts", "Markets");
                     h.ingest("Court upholds ruling", "Law");
                     auto removed = h.engine->remove(id);
                     require(removed.ok() && removed.value(), "removed");
                     auto again = h.engine->remove(id);
                     require(again.ok() && !again.value(), "already gone");

                     const auto state = h.engine->snapshot();
                     require(state->size() == 1 && state->vectors.size() == 1, "consistent");
                     auto hits = h.engine->search("oil supply");
                     require(hits.ok(), hits.error());
                     for (const auto &hit : hits.value().results) {
                       require(hit.document.id != id, "removed document not returned");
                     }
                   }});

  tests.push_back({"engine_search_on_empty_index_is_empty_index", [] {
                     Harness h;
                     require(h.engine->search("anything").code() == ErrorCode::EmptyIndex,
                             "search");
                     require(h.engine->answer("anything").code() == ErrorCode::EmptyIndex,
                             "answer");
                     require(h.chat->calls() == 0, "no synthesis");
                   }});

  tests.push_back({"engine_search_uses_configured_k", [] {
                     t::ScopedRecorder recorder;
                     Harness h;
                     auto built = h.engine->build_index(numbered("Markets", 8, "Bond yields"),
                                                        en::BuildMode::Replace);
                     require(built.ok(), built.error());

                     auto defaulted = h.engine->search("bond yields");
                     require(defaulted.ok(), defaulted.error());
                     require(defaulted.value().results.size() == 5, "top_k default");
                     auto two = h.engine->search("bond yields", 2);
                     require(two.ok(), two.error());
                     require(two.value().results.size() == 2, "explicit k");
                     require(two.value().results[0].score >= two.value().results[1].score,
                             "ranked");

                     std::size_t focused = 0;
                     for (const auto &metric : recorder.events().metrics) {
                       if (const auto *latency = std::get_if<obs::QueryLatencyMetric>(&metric);
                           latency != nullptr && latency->mode == "focused") {
                         ++focused;
                       }
                     }
                     require(focused == 2, "latency recorded per query");
                   }});

  tests.push_back({"engine_query_embeddings_expire_after_ttl", [] {
                     Harness h([](newsdesk::config::Config &config) {
                       config.cache.ttl_seconds = 1;
                     });
                     h.ingest("Central bank raises rates", "Markets");
                     const auto base = h.embedder->calls();

                     require(h.engine->search("X").ok(), "first search");
                     require(h.embedder->calls() == base + 1, "query embedded");
                     require(h.engine->search("X").ok(), "second search");
                     require(h.embedder->calls() == base + 1, "served from cache");
                     const auto warm = h.engine->status().cache;

                     h.clock.advance(std::chrono::milliseconds(1500));
                     require(h.engine->search("X").ok(), "third search");
                     require(h.embedder->calls() == base + 2, "fresh provider call after ttl");
                     const auto cold = h.engine->status().cache;
                     require(cold.misses == warm.misses + 1, "recorded as miss");
                     require(cold.hits == warm.hits, "no extra hit");
                   }});

  tests.push_back({"engine_answer_returns_synthesized_text", [] {
                     Harness h;
                     h.ingest("Central bank raises rates by a quarter point", "Markets");
                     h.ingest("Mortgage demand slows", "RealEstate");
                     h.chat->set_response("Rates rose.");

                     auto response = h.engine->answer("what happened to rates");
                     require(response.ok(), response.error());
                     require(response.value().answer.ok(), response.value().answer.error());
                     const auto &answer = response.value().answer.value();
                     require(answer.text == "Rates rose.", "text");
                     require(answer.character_count == 11, "character count");
                     require(answer.fragments_used == 2, "fragments used");
                     require(answer.fragment_ids.size() == 2, "fragment ids");
                     require(!response.value().retrieval.results.empty(), "retrieval kept");
                     const auto request = h.chat->last_request();
                     require(request.has_value(), "provider called");
                     require(request->message.find("what happened to rates") != std::string::npos,
                             "question in prompt");
                   }});

  tests.push_back({"engine_synthesis_failure_keeps_retrieval", [] {
                     t::ScopedRecorder recorder;
                     Harness h;
                     h.ingest("Central bank raises rates", "Markets");
                     h.chat->set_error("upstream 503");

                     auto response = h.engine->answer("rates");
                     require(response.ok(), response.error());
                     require(response.value().answer.code() == ErrorCode::SynthesisError,
                             "synthesis error");
                     require(response.value().retrieval.results.size() == 1, "fragments kept");

                     bool recorded = false;
                     for (const auto &error : recorder.events().of<obs::ErrorEvent>()) {
                       recorded = recorded || error.component == "synthesis";
                     }
                     require(recorded, "synthesis error recorded");
                   }});

  tests.push_back({"engine_category_sections_follow_taxonomy", [] {
                     Harness h(three_categories);
                     auto business = numbered("Business", 10, "Market outlook");
                     auto technology = numbered("Technology", 5, "Chip market outlook");
                     business.insert(business.end(), technology.begin(), technology.end());
                     auto built = h.engine->build_index(business, en::BuildMode::Replace);
                     require(built.ok(), built.error());
                     require(built.value().total == 15, "fifteen documents");

                     auto result = h.engine->search_all_categories("market outlook");
                     require(result.ok(), result.error());
                     const auto &sections = result.value().sections;
                     require(sections.size() == 3, "one section per category");
                     require(sections[0].category == "Business" && !sections[0].empty,
                             "business populated");
                     require(sections[1].category == "RealEstate" && sections[1].empty &&
                                 sections[1].results.empty(),
                             "real estate marked empty");
                     require(sections[2].category == "Technology" && !sections[2].empty,
                             "technology populated");
                     for (const auto &section : sections) {
                       require(section.results.size() <= 2, "per-category k");
                       for (const auto &hit : section.results) {
                         require(hit.document.category == section.category, "no cross-category");
                       }
                     }
                   }});

  tests.push_back({"engine_category_search_on_empty_corpus", [] {
                     Harness h(three_categories);
                     auto result = h.engine->search_all_categories("anything");
                     require(result.ok(), result.error());
                     require(result.value().sections.size() == 3, "all sections");
                     for (const auto &section : result.value().sections) {
                       require(section.empty && section.results.empty(), "all empty");
                     }

                     auto answer = h.engine->answer_all_categories("anything");
                     require(answer.ok(), answer.error());
                     require(answer.value().answer.ok(), answer.value().answer.error());
                     require(h.chat->calls() == 0, "no synthesis for an empty corpus");
                     require(answer.value().answer.value().categories_empty.size() == 3,
                             "every category empty");
                   }});

  tests.push_back({"engine_answer_all_categories", [] {
                     Harness h(three_categories);
                     h.ingest("Retail earnings beat estimates", "Business");
                     h.ingest("Chip exports rebound", "Technology");
                     h.chat->set_response("BUSINESS\nEarnings beat.\n\nTECHNOLOGY\nExports up.");

                     auto response = h.engine->answer_all_categories("weekly digest");
                     require(response.ok(), response.error());
                     require(response.value().answer.ok(), response.value().answer.error());
                     const auto &answer = response.value().answer.value();
                     require(h.chat->calls() == 1, "one provider call");
                     require(answer.categories_with_data ==
                                 std::vector<std::string>({"Business", "Technology"}),
                             "categories with data");
                     require(answer.categories_empty == std::vector<std::string>({"RealEstate"}),
                             "empty categories");
                     require(h.chat->last_request()->message.find("### REALESTATE ###") !=
                                 std::string::npos,
                             "empty category still in prompt");
                   }});

  tests.push_back({"engine_save_and_load_across_instances", [] {
                     t::ScopedRecorder recorder;
                     Harness writer;
                     writer.ingest("Oil climbs", "Markets");
                     writer.ingest("Court ruling", "Law");
                     writer.ingest("Rent index", "RealEstate");
                     auto saved = writer.engine->save();
                     require(saved.ok(), saved.error());
                     require(saved.value().manifest.snapshot_id == "0000000001", "first snapshot");
                     require(recorder.events().of<obs::SnapshotSavedEvent>().size() == 1,
                             "save recorded");

                     auto created = en::Engine::create(writer.config, writer.dependencies());
                     require(created.ok(), created.error());
                     auto &reader = *created.value();
                     require(reader.load().ok(), "load");
                     const auto status = reader.status();
                     require(status.loaded, "loaded");
                     require(status.document_count == 3 && status.vector_count == 3, "counts");
                     require(status.active_snapshot == std::optional<std::string>("0000000001"),
                             "active snapshot");
                     require(status.backup_complete, "backup complete");
                     require(status.size_bytes > 0, "size on disk");
                     require(reader.snapshot()->snapshot_id == "0000000001", "state snapshot id");
                     require(reader.search("oil").ok(), "searchable");
                   }});

  tests.push_back({"engine_load_failures_keep_current_state", [] {
                     Harness h;
                     h.ingest("Oil climbs", "Markets");
                     require(h.engine->load().code() == ErrorCode::NotFound, "nothing saved");
                     require(h.engine->snapshot()->size() == 1, "state kept");

                     auto saved = h.engine->save();
                     require(saved.ok(), saved.error());

                     Harness other({}, "text-embedding-3-small");
                     other.config.persistence.root = h.config.persistence.root;
                     auto created = en::Engine::create(other.config, other.dependencies());
                     require(created.ok(), created.error());
                     require(created.value()->load().code() == ErrorCode::Corrupt,
                             "other embedding model");
                     require(created.value()->snapshot()->size() == 0, "still empty");
                   }});

  tests.push_back({"engine_interrupted_save_leaves_snapshot_consistent", [] {
                     Harness h;
                     h.ingest("Oil climbs", "Markets");
                     h.ingest("Court ruling", "Law");
                     auto saved = h.engine->save();
                     require(saved.ok(), saved.error());

                     const auto root = fs::path(h.config.persistence.root);
                     const auto partial = root / "snapshots" / ".tmp-0000000002";
                     fs::create_directories(partial);
                     std::ofstream(partial / newsdesk::persistence::kIndexFile) << "NDVX";

                     auto created = en::Engine::create(h.config, h.dependencies());
                     require(created.ok(), created.error());
                     require(created.value()->load().ok(), "load");
                     const auto status = created.value()->status();
                     require(status.document_count == 2 && status.vector_count == 2, "consistent");
                     require(status.active_snapshot == std::optional<std::string>("0000000001"),
                             "previous snapshot active");
                   }});

  tests.push_back({"engine_export_then_import_into_fresh_instance", [] {
                     Harness source;
                     auto built = source.engine->build_index(numbered("Markets", 15, "Bond yields"),
                                                             en::BuildMode::Replace);
                     require(built.ok(), built.error());
                     require(source.engine->export_bundle(source.ws.path() / "early.tar").code() ==
                                 ErrorCode::NotFound,
                             "export needs a save");
                     auto saved = source.engine->save();
                     require(saved.ok(), saved.error());
                     const auto bundle = source.ws.path() / "backup.tar";
                     auto exported = source.engine->export_bundle(bundle);
                     require(exported.ok(), exported.error());

                     Harness target;
                     auto imported = target.engine->import_bundle(bundle);
                     require(imported.ok(), imported.error());
                     require(imported.value().document_count == 15, "documents");
                     require(imported.value().vector_count == 15, "vectors");
                     require(imported.value().snapshot_id == "0000000001", "snapshot id");
                     require(imported.value().bundle_bytes == exported.value().bytes, "bytes");

                     const auto status = target.engine->status();
                     require(status.vector_count == 15, "status vector count");
                     require(status.loaded && status.backup_complete, "loaded and backed up");
                     auto hits = target.engine->search("bond yields", 3);
                     require(hits.ok(), hits.error());
                     require(hits.value().results.size() == 3, "searchable after import");
                   }});

  tests.push_back({"engine_rejected_import_leaves_status_unchanged", [] {
                     Harness h;
                     h.ingest("Oil climbs", "Markets");
                     h.ingest("Court ruling", "Law");
                     auto saved = h.engine->save();
                     require(saved.ok(), saved.error());
                     const auto bundle = h.ws.path() / "backup.tar";
                     auto exported = h.engine->export_bundle(bundle);
                     require(exported.ok(), exported.error());

                     // Same bundle without documents.db.
                     const auto members = h.ws.path() / "members";
                     fs::create_directories(members);
                     auto names = newsdesk::persistence::extract_tar(bundle, members);
                     require(names.ok(), names.error());
                     std::vector<newsdesk::persistence::TarMember> kept;
                     for (const auto &name : names.value()) {
                       if (name != newsdesk::persistence::kDocumentsFile) {
                         kept.push_back({.name = name, .source = members / name});
                       }
                     }
                     const auto broken = h.ws.path() / "broken.tar";
                     require(newsdesk::persistence::write_tar(broken, kept).ok(), "write");

                     h.ingest("Rent index", "RealEstate");
                     const auto before = h.engine->status();
                     const auto state_before = h.engine->snapshot();
                     auto imported = h.engine->import_bundle(broken);
                     require(imported.code() == ErrorCode::ImportRejected, "rejected");
                     const auto after = h.engine->status();
                     require(h.engine->snapshot() == state_before, "state untouched");
                     require(after.loaded == before.loaded, "loaded");
                     require(after.document_count == before.document_count, "documents");
                     require(after.vector_count == before.vector_count, "vectors");
                     require(after.active_snapshot == before.active_snapshot, "active snapshot");
                     require(after.size_bytes == before.size_bytes, "size");
                     require(after.backup_complete == before.backup_complete, "backup");
                   }});

  tests.push_back({"engine_readers_never_see_partial_state", [] {
                     Harness h;
                     auto built = h.engine->build_index(numbered("Markets", 10, "Bond yields"),
                                                        en::BuildMode::Replace);
                     require(built.ok(), built.error());

                     std::atomic<bool> done{false};
                     std::atomic<std::size_t> failures{0};
                     std::vector<std::thread> readers;
                     for (int r = 0; r < 4; ++r) {
                       readers.emplace_back([&] {
                         while (!done.load()) {
                           const auto state = h.engine->snapshot();
                           if (state->documents.size() != state->vectors.size()) {
                             failures.fetch_add(1);
                           }
                           if (!h.engine->search("bond yields", 3).ok()) {
                             failures.fetch_add(1);
                           }
                         }
                       });
                     }

                     for (int i = 0; i < 20; ++i) {
                       auto id = h.engine->ingest(doc("Equity flows " + std::to_string(i), "Markets"));
                       if (!id.ok()) {
                         failures.fetch_add(1);
                       }
                     }
                     auto grown = h.engine->build_index(numbered("Law", 5, "Court docket"),
                                                        en::BuildMode::Incremental);
                     done.store(true);
                     for (auto &reader : readers) {
                       reader.join();
                     }
                     require(grown.ok(), grown.error());
                     require(failures.load() == 0, "readers saw consistent states");
                     require(h.engine->snapshot()->size() == 35, "all writes applied");
                   }});
}
