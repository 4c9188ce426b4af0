#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "vellum/boxed.hpp"
#include "vellum/element.hpp"
#include "vellum/leaves.hpp"
#include "vellum/raw.hpp"
#include "vellum/render.hpp"
#include "vellum/renderer.hpp"
#include "vellum/template_builder.hpp"
#include "vellum/text_sink.hpp"

namespace vellum {
namespace {

static_assert(render_once_producer<Box_Render_Once>);
static_assert(!render_mut_producer<Box_Render_Once>);
static_assert(render_mut_producer<Box_Render_Mut>);
static_assert(!render_producer<Box_Render_Mut>);
static_assert(render_producer<Box_Render>);

int live_producers = 0;

/// @brief Counts the instances alive and how often it was rendered.
struct Tracked {
    std::u8string_view text;
    int* renders;

    Tracked(std::u8string_view text, int* renders)
        : text { text }
        , renders { renders }
    {
        ++live_producers;
    }
    Tracked(Tracked&& other) noexcept
        : text { other.text }
        , renders { other.renders }
    {
        ++live_producers;
    }
    Tracked(const Tracked&) = delete;
    Tracked& operator=(const Tracked&) = delete;
    ~Tracked()
    {
        --live_producers;
    }

    [[nodiscard]]
    std::size_t size_hint() const
    {
        return text.size();
    }

    void render_once(Template_Builder& out) &&
    {
        ++*renders;
        out.write_escaped(text);
    }
};

struct Counter {
    int count = 0;

    [[nodiscard]]
    std::size_t size_hint() const
    {
        return 1;
    }

    void render_mut(Template_Builder& out)
    {
        out << ++count;
    }
};

struct Boxed_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Vector_Text_Sink out { &memory };
    Template_Builder builder { out };

    void SetUp() override
    {
        live_producers = 0;
    }
};

TEST_F(Boxed_Test, once_renders_exactly_once_and_frees)
{
    int renders = 0;
    {
        Box_Render_Once box { Tracked { u8"<x>", &renders } };
        EXPECT_EQ(live_producers, 1);
        EXPECT_EQ(box.size_hint(), 3);

        builder << std::move(box);

        EXPECT_EQ(renders, 1);
        EXPECT_EQ(live_producers, 0);
        EXPECT_FALSE(box);

        // A spent handle renders nothing.
        builder << std::move(box);
        EXPECT_EQ(box.size_hint(), 0);
    }
    EXPECT_EQ(out.str(), u8"&lt;x&gt;");
    EXPECT_EQ(renders, 1);
}

TEST_F(Boxed_Test, once_unrendered_is_freed)
{
    int renders = 0;
    {
        const Box_Render_Once box { Tracked { u8"unused", &renders } };
        EXPECT_EQ(live_producers, 1);
    }
    EXPECT_EQ(live_producers, 0);
    EXPECT_EQ(renders, 0);
}

TEST_F(Boxed_Test, mut_handle_is_repeatable)
{
    Box_Render_Mut box { Counter {} };

    EXPECT_EQ(box.size_hint(), 1);
    box.render_mut(builder);
    builder << box;
    builder << std::move(box);

    EXPECT_EQ(out.str(), u8"123");
    EXPECT_FALSE(box);
}

TEST_F(Boxed_Test, read_handle_is_identical_to_unboxed)
{
    const auto element_producer = element(u8"p", u8"a & b");
    builder << element_producer;
    const std::u8string expected { out.str() };
    (*out).clear();

    const Box_Render box { element_producer };
    builder << box;
    builder << box;

    EXPECT_EQ(out.str(), expected + expected);
    EXPECT_EQ(box.size_hint(), element_producer.size_hint());
}

TEST_F(Boxed_Test, heterogeneous_vector)
{
    std::vector<Box_Render> producers;
    producers.emplace_back(u8"<plain>");
    producers.emplace_back(Raw(u8"<raw>"));
    producers.emplace_back(make_renderer(3, [](Template_Builder& out) { out << 123; }));
    producers.emplace_back(element(u8"i", std::u8string { u8"it" }));

    for (const Box_Render& p : producers) {
        builder << p;
    }

    EXPECT_EQ(out.str(), u8"&lt;plain&gt;<raw>123<i>it</i>");
}

TEST_F(Boxed_Test, stronger_handle_into_weaker_handle)
{
    Box_Render read { Raw(u8"<hr/>") };
    Box_Render_Mut mut { std::move(read) };
    Box_Render_Once once { std::move(mut) };

    builder << std::move(once);

    EXPECT_EQ(out.str(), u8"<hr/>");
}

TEST_F(Boxed_Test, default_handles_render_nothing)
{
    const Box_Render read;
    Box_Render_Mut mut;
    Box_Render_Once once;

    builder << read << mut << std::move(once);

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(read.size_hint(), 0);
}

} // namespace
} // namespace vellum
