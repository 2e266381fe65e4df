#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "SentNeuron/Codec.hpp"
#include "SentNeuron/Config.hpp"
#include "SentNeuron/Dataset.hpp"
#include "test_helpers.hpp"

using namespace sentneuron;
using test_utils::TempDir;

TEST(CodecTest, TextTokenizesByCodePoint) {
    auto symbols = tokenize("txt", "a\xC3\xA9 \xE2\x82\xAC");
    ASSERT_EQ(symbols.size(), 4u);
    EXPECT_EQ(symbols[0], "a");
    EXPECT_EQ(symbols[1], "\xC3\xA9");
    EXPECT_EQ(symbols[2], " ");
    EXPECT_EQ(symbols[3], "\xE2\x82\xAC");
}

TEST(CodecTest, SymbolicStreamsSplitOnWhitespace) {
    auto symbols = tokenize("midi_note", "  n_60_q   w_2\n.\tn_64_h ");
    EXPECT_EQ(symbols, (std::vector<std::string>{"n_60_q", "w_2", ".", "n_64_h"}));
    EXPECT_THROW(tokenize("wav", "x"), std::invalid_argument);
}

TEST(CodecTest, VocabularyIsSortedAndDense) {
    auto vocab = build_vocabulary({"c", "a", "b"});
    EXPECT_EQ(vocab.at("a"), 0);
    EXPECT_EQ(vocab.at("b"), 1);
    EXPECT_EQ(vocab.at("c"), 2);
}

TEST(CodecTest, TextCodecEncodesAndDecodes) {
    auto codec = make_codec("txt", build_vocabulary({"h", "i", "!"}));
    EXPECT_EQ(codec->type(), "txt");
    EXPECT_FALSE(codec->is_symbolic());
    EXPECT_EQ(codec->vocab_size(), 3u);

    auto ids = codec->encode(codec->symbols("hi!"));
    EXPECT_EQ(ids, (std::vector<int>{1, 2, 0}));
    EXPECT_EQ(codec->decode(ids), "hi!");

    EXPECT_THROW(codec->encode({"x"}), std::invalid_argument);
    EXPECT_THROW(codec->symbol(3), std::out_of_range);
    EXPECT_THROW(codec->symbol(-1), std::out_of_range);
}

TEST(CodecTest, SymbolCodecJoinsWithSpaces) {
    auto codec = make_codec("midi_chord", build_vocabulary({"c_60_64", "w_1", "."}));
    EXPECT_TRUE(codec->is_symbolic());
    EXPECT_EQ(codec->type(), "midi_chord");
    auto ids = codec->encode({"c_60_64", "w_1"});
    EXPECT_EQ(codec->decode(ids), "c_60_64 w_1");
    EXPECT_TRUE(codec->contains("."));
    EXPECT_FALSE(codec->contains("n_1"));
}

TEST(CodecTest, RejectsBrokenVocabularies) {
    EXPECT_THROW(TextCodec(Vocabulary{{"a", 0}, {"b", 2}}), std::invalid_argument);
    EXPECT_THROW(TextCodec(Vocabulary{{"a", 1}, {"b", 1}}), std::invalid_argument);
    EXPECT_THROW(make_codec("mp3", {}), std::invalid_argument);
}

TEST(DatasetTest, DirectoryHoldsOutLastShard) {
    TempDir dir("dataset");
    dir.write("b.txt", "bbb");
    dir.write("a.txt", "aaa");
    dir.write("c.txt", "xyz");

    auto ds = Dataset::open(dir.path(), "txt");
    ASSERT_EQ(ds.shard_count(), 2u);
    EXPECT_EQ(ds.train_shards()[0].name, "a.txt");
    EXPECT_EQ(ds.train_shards()[1].name, "b.txt");
    EXPECT_EQ(ds.test_shard().name, "c.txt");
    EXPECT_EQ(ds.name(), dir.path().filename().string());
    EXPECT_EQ(ds.read(ds.test_shard()), "xyz");

    EXPECT_EQ(ds.scan_vocabulary(), (std::set<std::string>{"a", "b", "x", "y", "z"}));
}

TEST(DatasetTest, SingleFileIsTrainAndTest) {
    TempDir dir("single");
    auto file = dir.write("song.txt", "n_1 w_2 n_1");
    auto ds = Dataset::open(file, "midi_note");
    ASSERT_EQ(ds.shard_count(), 1u);
    EXPECT_EQ(ds.test_shard().path, file);
    EXPECT_EQ(ds.scan_vocabulary(), (std::set<std::string>{"n_1", "w_2"}));
}

TEST(DatasetTest, MissingPathAndBadTypeThrow) {
    TempDir dir("missing");
    EXPECT_THROW(Dataset::open(dir.path() / "nope", "txt"), std::runtime_error);
    EXPECT_THROW(Dataset::open(dir.path(), "txt"), std::runtime_error);
    EXPECT_THROW(Dataset::open(dir.path(), "flac"), std::invalid_argument);
}

TEST(ConfigTest, TrainConfigOverridesOnlyGivenKeys) {
    TempDir dir("config");
    auto file = dir.write("train.json", R"({"hidden_size": 32, "lr": 0.01, "data_type": "midi_note"})");

    TrainConfig config;
    ASSERT_TRUE(config.load(file.string()));
    EXPECT_EQ(config.hidden_size, 32);
    EXPECT_DOUBLE_EQ(config.lr, 0.01);
    EXPECT_EQ(config.data_type, "midi_note");
    EXPECT_EQ(config.embed_size, 64);
    EXPECT_EQ(config.batch_size, 128);
    EXPECT_NO_THROW(config.validate());

    config.dropout = 1.0f;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    EXPECT_FALSE(config.load((dir.path() / "absent.json").string()));
    auto bad = dir.write("bad.json", "{ not json");
    EXPECT_FALSE(config.load(bad.string()));
}

TEST(ConfigTest, MetadataAndTrainingStateRoundTrip) {
    TempDir dir("meta");
    ModelMetadata meta;
    meta.dataset.data_type = "txt";
    meta.dataset.train = {{"/data/a.txt", "a.txt"}};
    meta.dataset.test = {{"/data/b.txt", "b.txt"}};
    meta.vocab = build_vocabulary({"x", "y"});
    meta.input_size = meta.output_size = 2;
    meta.embed_size = 4;
    meta.hidden_size = 8;
    meta.n_layers = 2;
    meta.dropout = 0.25f;
    ASSERT_TRUE(meta.save(dir.path() / "m.json"));

    ModelMetadata loaded;
    ASSERT_TRUE(loaded.load(dir.path() / "m.json"));
    EXPECT_EQ(loaded.dataset.data_type, "txt");
    ASSERT_EQ(loaded.dataset.test.size(), 1u);
    EXPECT_EQ(loaded.dataset.test[0].name, "b.txt");
    EXPECT_EQ(loaded.vocab, meta.vocab);
    EXPECT_EQ(loaded.hidden_size, 8);
    EXPECT_EQ(loaded.n_layers, 2);
    EXPECT_FLOAT_EQ(loaded.dropout, 0.25f);

    TrainingState state{3, 1, 17, 2.5};
    ASSERT_TRUE(state.save(dir.path() / "t.json"));
    TrainingState back;
    ASSERT_TRUE(back.load(dir.path() / "t.json"));
    EXPECT_EQ(back.epoch, 3);
    EXPECT_EQ(back.shard, 1);
    EXPECT_EQ(back.batch, 17);
    EXPECT_DOUBLE_EQ(back.loss, 2.5);
}
