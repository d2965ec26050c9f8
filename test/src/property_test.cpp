#include <gtest/gtest.h>
#include <vector>
#include "datamap/datamap.hpp"
#include "logger.hpp"

using namespace datamap;

static std::vector<std::string> warnings;

static void capture(log_level level, const std::string_view& msg) {
    if (level == log_level::Warning) warnings.emplace_back(msg);
    logger(level, msg);
}

struct Article : Entity<Article> {
    Slot<int64_t> id;
    Slot<std::string> title;
    Slot<std::string> body;
    Slot<bool> published;
    Slot<double> rating;
    Slot<std::string> slug;
    Slot<int64_t> num_views;
    Slot<std::string> code;

    static const Model<Article>& model() {
        static const Model<Article> model("Article", [](Model<Article>& m) {
            m.logger(capture);
            m.property<&Article::id>("id", "Serial");
            m.property<&Article::title>("title", "String", { .nullable = false, .length = Length(1, 100) });
            m.property<&Article::body>("body", "Text");
            m.property<&Article::published>("published?", "Boolean", { .default_value = false });
            m.property<&Article::rating>("rating", "Decimal", { .precision = 5, .scale = 2 });
            m.property<&Article::slug>("slug", "String", {
                .default_value = [](Resource& r, const Property&) -> Value {
                    auto title = r.attribute_get("title");
                    if (title.is_nil()) return "untitled";
                    return naming::underscore(title.get<std::string>());
                },
            });
            m.property<&Article::num_views>("NumViews", "Integer", { .writer = access_t::private_access });
            m.property<&Article::code>("code", "String", { .field = "article_code", .size = 8, .accessor = access_t::protected_access });
        });
        return model;
    }
};

struct Counter : Entity<Counter> {
    Slot<int64_t> id;

    static const Model<Counter>& model() {
        static const Model<Counter> model("Counter", [](Model<Counter>& m) {
            m.property<&Counter::id>("id", "Serial", { .unique = false });
        });
        return model;
    }
};

// a saved article, as a repository would hand it back
static std::shared_ptr<Article> loaded_article() {
    Query query(Article::model());
    query.fields({ "id", "title", "published", "slug" });
    auto resource = Article::model().load({ 1, "First", true, "first" }, query);
    return std::static_pointer_cast<Article>(resource);
}

TEST(PropertyTest, KeyAndSerialOptions)
{
    const auto& id = Article::model().properties().at("id");
    EXPECT_TRUE(id.key());
    EXPECT_TRUE(id.serial());
    EXPECT_TRUE(id.unique());
    EXPECT_FALSE(id.nullable());
    EXPECT_FALSE(id.lazy());

    const auto& title = Article::model().properties().at("title");
    EXPECT_FALSE(title.key());
    EXPECT_FALSE(title.unique());
    EXPECT_FALSE(title.nullable());
    EXPECT_EQ(title.length(), 100);

    const auto& body = Article::model().properties().at("body");
    EXPECT_TRUE(body.nullable());
    EXPECT_TRUE(body.lazy());
    EXPECT_EQ(body.lazy_contexts(), std::vector<std::string>{ "default" });
    EXPECT_EQ(body.length(), 65535);
}

TEST(PropertyTest, ExplicitOptionsWin)
{
    const auto& id = Counter::model().properties().at("id");
    EXPECT_TRUE(id.key());
    EXPECT_FALSE(id.unique());
}

TEST(PropertyTest, PredicateNameIsStripped)
{
    const auto& props = Article::model().properties();
    EXPECT_EQ(props["published?"], nullptr);
    ASSERT_NE(props["published"], nullptr);
    EXPECT_TRUE(props["published"]->is_boolean());
    EXPECT_EQ(props["published"]->field(), "published");
}

TEST(PropertyTest, NumericOptions)
{
    const auto& rating = Article::model().properties().at("rating");
    EXPECT_EQ(rating.precision(), 5);
    EXPECT_EQ(rating.scale(), 2);

    // text types carry no precision
    EXPECT_FALSE(Article::model().properties().at("title").precision().has_value());
}

TEST(PropertyTest, InvalidOptions)
{
    auto declare = [](const char* type, PropertyOptions options) {
        Model<Article> broken("Broken", [&](Model<Article>& m) {
            if (std::string(type) == "String") {
                m.property<&Article::title>("title", type, options);
            } else {
                m.property<&Article::rating>("rating", type, options);
            }
        });
    };

    EXPECT_THROW(declare("String", { .default_value = Value{} }), DefinitionError);
    EXPECT_THROW(declare("String", { .field = "" }), DefinitionError);
    EXPECT_THROW(declare("String", { .length = Length(10, 2) }), DefinitionError);
    EXPECT_THROW(declare("String", { .precision = 4 }), DefinitionError);
    EXPECT_THROW(declare("Decimal", { .length = 4 }), DefinitionError);
    EXPECT_THROW(declare("Decimal", { .precision = 0 }), DefinitionError);
    EXPECT_THROW(declare("Decimal", { .scale = -1 }), DefinitionError);
    EXPECT_THROW(declare("Decimal", { .precision = 2, .scale = 3 }), DefinitionError);
    EXPECT_THROW(declare("Money", {}), DefinitionError);
    EXPECT_NO_THROW(declare("Float", { .precision = 8 }));
}

TEST(PropertyTest, SlotMustMatchType)
{
    auto declare = []() {
        Model<Article> broken("Broken", [](Model<Article>& m) {
            m.property<&Article::title>("title", "Integer");
        });
    };
    EXPECT_THROW(declare(), DefinitionError);
}

TEST(PropertyTest, SizeIsAnAliasOfLength)
{
    const auto& code = Article::model().properties().at("code");
    EXPECT_EQ(code.length(), 8);
    EXPECT_FALSE(code.options().size.has_value());

    bool warned = std::find_if(warnings.begin(), warnings.end(), [](const std::string& w) {
        return w.find("+size+ is deprecated") != std::string::npos;
    }) != warnings.end();
    EXPECT_TRUE(warned);
}

TEST(PropertyTest, FieldNaming)
{
    const auto& props = Article::model().properties();
    EXPECT_EQ(props.at("NumViews").field(), "num_views");
    EXPECT_EQ(props.at("code").field(), "article_code");
    EXPECT_EQ(props.at("code").repository_name(), "default");

    EXPECT_EQ(props.at("code").field("default"), "article_code");
    EXPECT_THROW(props.at("code").field("legacy"), UsageError);
}

TEST(PropertyTest, Visibility)
{
    const auto& props = Article::model().properties();
    EXPECT_EQ(props.at("title").reader_visibility(), access_t::public_access);
    EXPECT_EQ(props.at("NumViews").reader_visibility(), access_t::public_access);
    EXPECT_EQ(props.at("NumViews").writer_visibility(), access_t::private_access);
    EXPECT_EQ(props.at("code").reader_visibility(), access_t::protected_access);
    EXPECT_EQ(props.at("code").writer_visibility(), access_t::protected_access);
}

TEST(PropertyTest, Equality)
{
    const auto& props = Article::model().properties();
    EXPECT_EQ(props.at("title"), props.at("title"));
    EXPECT_FALSE(props.at("title") == props.at("body"));

    std::ostringstream ss;
    ss << props.at("title");
    EXPECT_EQ(ss.str(), "Article#title");
}

TEST(PropertyTest, StaticDefaultIsStoredOnFirstRead)
{
    Article article;
    EXPECT_FALSE(article.published.loaded());

    EXPECT_EQ(article.attribute_get("published"), Value(false));
    EXPECT_TRUE(article.published.loaded());
    EXPECT_EQ(article.published.value(), false);
}

TEST(PropertyTest, GeneratedDefaultSeesTheResource)
{
    Article untitled;
    EXPECT_EQ(untitled.attribute_get("slug"), Value("untitled"));

    Article article;
    article.attribute_set("title", "HelloWorld");
    EXPECT_EQ(article.attribute_get("slug"), Value("hello_world"));

    // an explicit value is never replaced by the default
    Article named;
    named.attribute_set("slug", "mine");
    EXPECT_EQ(named.attribute_get("slug"), Value("mine"));
}

TEST(PropertyTest, NoDefaultReadsNil)
{
    Article article;
    EXPECT_TRUE(article.attribute_get("title").is_nil());
    EXPECT_FALSE(article.title.loaded());
}

TEST(PropertyTest, SetTracksOriginalOnNewResource)
{
    Article article;
    EXPECT_FALSE(article.dirty());

    article.attribute_set("title", "Draft");
    ASSERT_NE(article.original_value("title"), nullptr);
    EXPECT_TRUE(article.original_value("title")->is_nil());

    auto dirty = article.dirty_attributes();
    ASSERT_EQ(dirty.size(), 1);
    EXPECT_EQ(dirty[0].first->name(), "title");
    EXPECT_EQ(dirty[0].second, Value("Draft"));

    // the same value again changes nothing
    article.attribute_set("title", "Draft");
    EXPECT_EQ(article.dirty_attributes().size(), 1);
}

TEST(PropertyTest, SetTracksOriginalOnSavedResource)
{
    auto article = loaded_article();
    EXPECT_FALSE(article->is_new());
    EXPECT_FALSE(article->dirty());
    EXPECT_EQ(article->attribute_get("title"), Value("First"));

    article->attribute_set("title", "Second");
    ASSERT_NE(article->original_value("title"), nullptr);
    EXPECT_EQ(*article->original_value("title"), Value("First"));
    EXPECT_TRUE(article->dirty());

    article->attribute_set("title", "Third");
    EXPECT_EQ(*article->original_value("title"), Value("First"));

    // back to the persisted value
    article->attribute_set("title", "First");
    EXPECT_FALSE(article->dirty());
}

TEST(PropertyTest, SetRejectsWrongKind)
{
    Article article;
    EXPECT_THROW(article.attribute_set("title", 12), UsageError);
    EXPECT_THROW(article.attribute_set("missing", 12), UsageError);

    // integers widen into real slots
    article.attribute_set("rating", 4);
    EXPECT_EQ(article.rating.value(), 4.0);
}

TEST(PropertyTest, KeyUsesOriginalValue)
{
    auto article = loaded_article();
    EXPECT_EQ(article->key(), std::vector<Value>{ 1 });

    article->attribute_set("id", 2);
    EXPECT_EQ(article->key(), std::vector<Value>{ 1 });

    Article fresh;
    fresh.attribute_set("id", 5);
    EXPECT_EQ(fresh.key(), std::vector<Value>{ 5 });
}

TEST(PropertyTest, UnloadedPropertyNeedsARepository)
{
    auto article = loaded_article();
    EXPECT_FALSE(article->body.loaded());
    EXPECT_THROW(article->attribute_get("body"), UsageError);
}
