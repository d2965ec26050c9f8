#include <gtest/gtest.h>
#include <thread>
#include "datamap/datamap.hpp"
#include "logger.hpp"

using namespace datamap;

struct Post : Entity<Post> {
    Slot<int64_t> id;
    Slot<std::string> author;
    Slot<std::string> title;
    Slot<std::string> body;
    Slot<std::string> summary;
    Slot<std::string> notes;
    Slot<std::string> email;
    Slot<std::string> legacy_ref;

    static const Model<Post>& model() {
        static const Model<Post> model("Post", [](Model<Post>& m) {
            m.logger(logger);
            m.property<&Post::id>("id", "Serial");
            m.property<&Post::author>("author", "String", { .index = Index{ "by_author", true } });
            m.property<&Post::title>("title", "String", { .index = "by_author", .length = 20 });
            m.property<&Post::body>("body", "Text", { .lazy = "content" });
            m.property<&Post::summary>("summary", "Text", { .lazy = "content" });
            m.property<&Post::notes>("notes", "Text", { .lazy = Lazy{ "content", "extra" } });
            m.property<&Post::email>("email", "String", { .unique_index = true });
            // re-declared, keeps its place
            m.property<&Post::title>("title", "String", { .index = "by_author", .length = 200 });

            m.repository("legacy", [](Model<Post>& m) {
                m.property<&Post::legacy_ref>("legacy_ref", "String");
            });
        });
        return model;
    }
};

static std::vector<std::string> names(const std::vector<const Property*>& properties) {
    std::vector<std::string> out;
    for (auto p : properties) out.push_back(p->name());
    return out;
}

TEST(PropertySetTest, DeclarationOrder)
{
    const auto& props = Post::model().properties();
    std::vector<std::string> declared;
    for (const auto& p : props) declared.push_back(p->name());

    EXPECT_EQ(declared, (std::vector<std::string>{ "id", "author", "title", "body", "summary", "notes", "email" }));
    EXPECT_EQ(props.size(), 7);
}

TEST(PropertySetTest, RedeclarationReplacesInPlace)
{
    const auto& props = Post::model().properties();
    EXPECT_EQ(props.at("title").length(), 200);
    EXPECT_EQ(props.values_at({ "title" }).front(), &props.at("title"));
}

TEST(PropertySetTest, Lookup)
{
    const auto& props = Post::model().properties();
    EXPECT_TRUE(props.named("author"));
    EXPECT_FALSE(props.named("legacy_ref"));
    EXPECT_TRUE(props.contains(props.at("body")));
    EXPECT_EQ(props["nope"], nullptr);
    EXPECT_THROW(props.at("nope"), UsageError);

    auto found = props.values_at({ "email", "nope" });
    ASSERT_EQ(found.size(), 2);
    EXPECT_EQ(found[0]->name(), "email");
    EXPECT_EQ(found[1], nullptr);
}

TEST(PropertySetTest, KeyAndDefaults)
{
    const auto& props = Post::model().properties();
    EXPECT_EQ(names(props.key()), std::vector<std::string>{ "id" });
    EXPECT_EQ(names(props.defaults()), (std::vector<std::string>{ "id", "author", "title", "email" }));
}

TEST(PropertySetTest, Indexes)
{
    const auto& props = Post::model().properties();

    auto indexes = props.indexes();
    ASSERT_EQ(indexes.size(), 2);
    EXPECT_EQ(indexes[0].name, "by_author");
    EXPECT_FALSE(indexes[0].anonymous);
    EXPECT_EQ(indexes[0].fields, (std::vector<std::string>{ "author", "title" }));
    EXPECT_EQ(indexes[1].name, "author");
    EXPECT_TRUE(indexes[1].anonymous);
    EXPECT_EQ(indexes[1].fields, std::vector<std::string>{ "author" });

    auto unique_indexes = props.unique_indexes();
    ASSERT_EQ(unique_indexes.size(), 1);
    EXPECT_TRUE(unique_indexes[0].anonymous);
    EXPECT_EQ(unique_indexes[0].fields, std::vector<std::string>{ "email" });
}

TEST(PropertySetTest, LazyContexts)
{
    const auto& props = Post::model().properties();

    EXPECT_EQ(props.lazy_contexts().at("content"), (std::vector<std::string>{ "body", "summary", "notes" }));
    EXPECT_EQ(props.lazy_contexts().at("extra"), std::vector<std::string>{ "notes" });
    EXPECT_EQ(props.property_contexts("notes"), (std::vector<std::string>{ "content", "extra" }));
    EXPECT_TRUE(props.property_contexts("author").empty());
}

TEST(PropertySetTest, LazyLoadContext)
{
    const auto& props = Post::model().properties();

    EXPECT_EQ(props.lazy_load_context({ "summary" }), (std::vector<std::string>{ "body", "summary", "notes" }));
    EXPECT_EQ(props.lazy_load_context({ "author", "body" }),
            (std::vector<std::string>{ "author", "body", "summary", "notes" }));
    EXPECT_EQ(props.lazy_load_context({ "title" }), std::vector<std::string>{ "title" });
    EXPECT_THROW(props.lazy_load_context({}), UsageError);
}

TEST(PropertySetTest, GetAndSet)
{
    Post post;
    const auto& props = Post::model().properties();
    props.set(post, { 1, "ann", "Hello" });

    EXPECT_EQ(post.author.value(), "ann");
    EXPECT_EQ(post.title.value(), "Hello");

    auto values = props.get(post);
    ASSERT_EQ(values.size(), props.size());
    EXPECT_EQ(values[0], Value(1));
    EXPECT_TRUE(values[3].is_nil());
}

TEST(PropertySetTest, RepositoryProperties)
{
    const auto& model = Post::model();
    const auto& legacy = model.properties("legacy");

    EXPECT_EQ(legacy.size(), 8);
    EXPECT_TRUE(legacy.named("legacy_ref"));
    EXPECT_EQ(legacy.at("legacy_ref").repository_name(), "legacy");
    EXPECT_FALSE(model.properties().named("legacy_ref"));

    // properties of the default repository are shared
    EXPECT_EQ(&legacy.at("title"), &model.properties().at("title"));

    // any other repository sees the default set
    EXPECT_EQ(model.properties("archive").size(), 7);
}

TEST(PropertySetTest, RepositoriesLookedUpFromManyThreads)
{
    const auto& model = Post::model();
    std::vector<size_t> fields(8);
    std::vector<size_t> keys(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < fields.size(); i++) {
        threads.emplace_back([&, i]() {
            Query query(model, "shard_" + std::to_string(i % 3));
            fields[i] = query.fields().size();
            keys[i] = query.properties().key().size();
        });
    }
    for (auto& t : threads) t.join();

    for (size_t i = 0; i < fields.size(); i++) {
        EXPECT_EQ(fields[i], 4);
        EXPECT_EQ(keys[i], 1);
    }
    EXPECT_EQ(model.properties("shard_0").size(), 7);
}

TEST(PropertySetTest, StorageNames)
{
    const auto& model = Post::model();
    EXPECT_EQ(model.storage_name(), "posts");
    EXPECT_EQ(model.identity_field(), &model.properties().at("id"));
    EXPECT_EQ(naming::underscored_and_pluralized("Category"), "categories");
    EXPECT_EQ(naming::underscored_and_pluralized("Blog::Box"), "boxes");
    EXPECT_EQ(naming::underscored_and_pluralized("HTTPRequest"), "http_requests");
    EXPECT_EQ(naming::underscored_and_pluralized("Day"), "days");
}
