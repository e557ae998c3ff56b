#include <gtest/gtest.h>

#include "taskpad/commands/task_details.hpp"
#include "taskpad/details/markup_continuation.hpp"
#include "taskpad/details/mode_controller.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using taskpad::details::ActivationPolicy;
using taskpad::details::ActivationRequest;
using taskpad::details::ActivationSource;
using taskpad::details::BlurEvent;
using taskpad::details::DetailsModeController;
using taskpad::details::EditorMode;
using taskpad::details::KeyDisposition;
using taskpad::details::PreviewTarget;
using taskpad::details::SelectionRange;
using taskpad::details::TextChange;
using taskpad::details::byteOffset;
using taskpad::details::codePointCount;

namespace cmd = taskpad::commands::details;

class FakeSurface : public taskpad::details::EditingSurface
{
public:
    std::string content;
    SelectionRange range;
    int focusRequests = 0;
    int caretPlacements = 0;

    std::string text() const override { return content; }
    SelectionRange selection() const override { return range; }

    // Offsets arrive in code points; the content is stored as UTF-8.
    void dispatch(const TextChange &change, SelectionRange selection) override
    {
        const std::size_t from = byteOffset(content, change.from);
        const std::size_t to = byteOffset(content, change.to);
        content.replace(from, to - from, change.insert);
        range = selection;
    }

    void placeCaretAtEnd() override
    {
        ++caretPlacements;
        range = SelectionRange::caret(codePointCount(content));
    }

    void requestFocus() override { ++focusRequests; }

    bool continueMarkup() override
    {
        if (range.from() != range.to())
            return false;
        const auto edit = taskpad::details::continueMarkupAt(content, range.head);
        if (!edit)
            return false;
        dispatch(edit->change, edit->selection);
        return true;
    }
};

class DetailsModeControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        controller.setModeListener([this](EditorMode mode) { modes.push_back(mode); });
    }

    // Mirrors the host: mount the surface seeded with the draft once the
    // controller enters Editing.
    bool open(PreviewTarget target = PreviewTarget::Text)
    {
        if (!controller.activate(ActivationRequest{ActivationSource::Pointer, target}))
            return false;
        surface.content = controller.draft();
        controller.surfaceCreated(surface);
        return true;
    }

    void type(const std::string &text)
    {
        surface.content = text;
        surface.range = SelectionRange::caret(codePointCount(text));
        controller.draftChanged(text);
    }

    std::vector<std::string> commits;
    std::vector<EditorMode> modes;
    FakeSurface surface;
    DetailsModeController controller{"Hello", [this](const std::string &value) { commits.push_back(value); }};
};

} // namespace

TEST_F(DetailsModeControllerTest, StartsInViewWithCommittedValue)
{
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_EQ("Hello", controller.displayedValue());
    EXPECT_FALSE(controller.session().hasDraft());
}

TEST_F(DetailsModeControllerTest, ActivationSeedsDraftFromCommittedValue)
{
    ASSERT_TRUE(open());
    EXPECT_EQ(EditorMode::Editing, controller.mode());
    EXPECT_TRUE(controller.session().hasDraft());
    EXPECT_EQ("Hello", controller.draft());
    ASSERT_EQ(1u, modes.size());
    EXPECT_EQ(EditorMode::Editing, modes.back());
}

TEST_F(DetailsModeControllerTest, KeyboardActivationEntersEditing)
{
    EXPECT_TRUE(controller.activate(ActivationRequest{ActivationSource::Keyboard, PreviewTarget::Text}));
    EXPECT_TRUE(controller.isEditing());
}

TEST_F(DetailsModeControllerTest, BlurWithoutChangesDoesNotCommit)
{
    ASSERT_TRUE(open());
    controller.blur(BlurEvent{false});

    EXPECT_TRUE(commits.empty());
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_EQ("Hello", controller.displayedValue());
}

TEST_F(DetailsModeControllerTest, CommitKeyPersistsDraftOnce)
{
    ASSERT_TRUE(open());
    type("Hello World");

    EXPECT_EQ(KeyDisposition::Handled, controller.runCommand(cmd::CommitAndClose));

    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("Hello World", commits.front());
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_EQ("Hello World", controller.displayedValue());

    // Unmounting the surface reports a blur; it must not persist again.
    controller.blur(BlurEvent{false});
    EXPECT_EQ(1u, commits.size());
}

TEST_F(DetailsModeControllerTest, ExternalUpdateDiscardsDraft)
{
    ASSERT_TRUE(open());
    type("Hello!!");

    controller.externalUpdate("Hi");

    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_EQ("Hi", controller.displayedValue());
    EXPECT_EQ("Hi", controller.committedValue());
    EXPECT_FALSE(controller.session().hasDraft());

    controller.blur(BlurEvent{false});
    controller.commitAndClose();
    EXPECT_TRUE(commits.empty());
}

TEST_F(DetailsModeControllerTest, ExternalUpdateInViewRefreshesPreview)
{
    controller.externalUpdate("Fresh");
    EXPECT_EQ("Fresh", controller.displayedValue());
    ASSERT_EQ(1u, modes.size());
    EXPECT_EQ(EditorMode::View, modes.back());
    EXPECT_TRUE(commits.empty());
}

TEST_F(DetailsModeControllerTest, ExternalEchoOfCommittedValueKeepsSession)
{
    ASSERT_TRUE(open());
    type("Hello, draft");

    controller.externalUpdate("Hello");

    EXPECT_TRUE(controller.isEditing());
    EXPECT_EQ("Hello, draft", controller.draft());
}

TEST_F(DetailsModeControllerTest, EscapeDiscardsWithoutPersisting)
{
    ASSERT_TRUE(open());
    type("something else");

    EXPECT_EQ(KeyDisposition::Handled, controller.runCommand(cmd::Discard));

    EXPECT_TRUE(commits.empty());
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_EQ("Hello", controller.displayedValue());

    controller.blur(BlurEvent{false});
    EXPECT_TRUE(commits.empty());
}

TEST_F(DetailsModeControllerTest, CompetingExitsPersistAtMostOnce)
{
    ASSERT_TRUE(open());
    type("Hello again");

    controller.commitAndClose();
    controller.blur(BlurEvent{false});
    controller.commitAndClose();
    controller.discard();
    controller.blur(BlurEvent{false});
    controller.externalUpdate("Hello again");

    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("Hello again", commits.front());
}

TEST_F(DetailsModeControllerTest, BlurInsideSurfaceIsIgnored)
{
    ASSERT_TRUE(open());
    type("Hello there");

    controller.blur(BlurEvent{true});
    EXPECT_TRUE(controller.isEditing());
    EXPECT_TRUE(commits.empty());

    controller.blur(BlurEvent{false});
    EXPECT_EQ(EditorMode::View, controller.mode());
    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("Hello there", commits.front());
}

TEST_F(DetailsModeControllerTest, NewSessionAfterDiscardCommitsOnBlur)
{
    ASSERT_TRUE(open());
    type("dropped");
    controller.discard();

    ASSERT_TRUE(open());
    EXPECT_EQ("Hello", controller.draft());
    type("kept");
    controller.blur(BlurEvent{false});

    ASSERT_EQ(1u, commits.size());
    EXPECT_EQ("kept", commits.front());
}

TEST_F(DetailsModeControllerTest, ActivationAfterCommitSeedsFromNewValue)
{
    ASSERT_TRUE(open());
    type("Second");
    controller.commitAndClose();

    ASSERT_TRUE(open());
    EXPECT_EQ("Second", controller.draft());
}

TEST_F(DetailsModeControllerTest, LineEndingOnlyChangesAreNotPersisted)
{
    DetailsModeController crlf("a\nb", [this](const std::string &value) { commits.push_back(value); });
    ASSERT_TRUE(crlf.activate(ActivationRequest{}));
    crlf.draftChanged("a\r\nb");
    crlf.commitAndClose();
    EXPECT_TRUE(commits.empty());
    EXPECT_EQ(EditorMode::View, crlf.mode());
}

TEST_F(DetailsModeControllerTest, ThrowingHookLeavesViewAndAdvancedMirror)
{
    DetailsModeController failing("Hello", [](const std::string &) { throw std::runtime_error("write failed"); });
    ASSERT_TRUE(failing.activate(ActivationRequest{}));
    failing.draftChanged("Hello World");

    EXPECT_THROW(failing.commitAndClose(), std::runtime_error);

    EXPECT_EQ(EditorMode::View, failing.mode());
    EXPECT_EQ("Hello World", failing.committedValue());
    EXPECT_FALSE(failing.session().hasDraft());
}

TEST_F(DetailsModeControllerTest, LinkClickDoesNotActivate)
{
    EXPECT_FALSE(open(PreviewTarget::Link));
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_TRUE(modes.empty());
}

TEST_F(DetailsModeControllerTest, TaskCheckboxActivatesByDefault)
{
    EXPECT_TRUE(open(PreviewTarget::TaskCheckbox));
    EXPECT_TRUE(controller.isEditing());
}

TEST_F(DetailsModeControllerTest, TaskCheckboxCanBeExempted)
{
    controller.setActivationPolicy(ActivationPolicy{true});
    EXPECT_FALSE(open(PreviewTarget::TaskCheckbox));
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_TRUE(open(PreviewTarget::Text));
}

TEST_F(DetailsModeControllerTest, ValueLargerThanSurfaceIsRefused)
{
    controller.setActivationPolicy(ActivationPolicy{false, 8});
    controller.externalUpdate("123456789");

    EXPECT_TRUE(controller.exceedsSurfaceCapacity());
    EXPECT_FALSE(open());
    EXPECT_EQ(EditorMode::View, controller.mode());
    EXPECT_FALSE(controller.session().hasDraft());
    EXPECT_TRUE(commits.empty());
}

TEST_F(DetailsModeControllerTest, ValueAtSurfaceLimitActivates)
{
    controller.setActivationPolicy(ActivationPolicy{false, 8});
    controller.externalUpdate("12345678");

    EXPECT_FALSE(controller.exceedsSurfaceCapacity());
    EXPECT_TRUE(open());
    EXPECT_EQ("12345678", controller.draft());
}

TEST_F(DetailsModeControllerTest, ActivationWhileEditingIsRefused)
{
    ASSERT_TRUE(open());
    type("draft");
    EXPECT_FALSE(controller.activate(ActivationRequest{}));
    EXPECT_EQ("draft", controller.draft());
}

TEST_F(DetailsModeControllerTest, CaretPlacementWaitsForScheduler)
{
    std::vector<std::function<void()>> tasks;
    controller.setScheduler([&](std::function<void()> task) { tasks.push_back(std::move(task)); });

    ASSERT_TRUE(open());
    EXPECT_EQ(0, surface.focusRequests);
    ASSERT_EQ(1u, tasks.size());

    tasks.front()();
    EXPECT_EQ(1, surface.caretPlacements);
    EXPECT_EQ(1, surface.focusRequests);
    EXPECT_EQ(SelectionRange::caret(5), surface.range);
}

TEST_F(DetailsModeControllerTest, DeferredPlacementSkipsUnmountedSurface)
{
    std::vector<std::function<void()>> tasks;
    controller.setScheduler([&](std::function<void()> task) { tasks.push_back(std::move(task)); });

    ASSERT_TRUE(open());
    controller.discard();
    ASSERT_EQ(1u, tasks.size());
    tasks.front()();

    EXPECT_EQ(0, surface.caretPlacements);
    EXPECT_EQ(0, surface.focusRequests);
}

TEST_F(DetailsModeControllerTest, DeferredPlacementSkipsDestroyedSurface)
{
    std::vector<std::function<void()>> tasks;
    controller.setScheduler([&](std::function<void()> task) { tasks.push_back(std::move(task)); });

    ASSERT_TRUE(open());
    controller.surfaceDestroyed(surface);
    tasks.front()();

    EXPECT_EQ(0, surface.focusRequests);
}

TEST_F(DetailsModeControllerTest, BoldCommandWrapsSurfaceSelection)
{
    controller.externalUpdate("Hello World");
    ASSERT_TRUE(open());
    surface.range = SelectionRange{6, 11};

    EXPECT_EQ(KeyDisposition::Handled, controller.runCommand(cmd::WrapBold));

    EXPECT_EQ("Hello **World**", surface.content);
    EXPECT_EQ((SelectionRange{8, 13}), surface.range);
    EXPECT_EQ("Hello **World**", controller.draft());
    EXPECT_TRUE(controller.isEditing());
}

TEST_F(DetailsModeControllerTest, LinkCommandUsesConfiguredUrl)
{
    taskpad::details::TransformCatalog catalog;
    catalog.link.suffix = "](https://example.com)";
    controller.setTransforms(catalog);
    controller.externalUpdate("");
    ASSERT_TRUE(open());
    surface.range = SelectionRange::caret(0);

    controller.runCommand(cmd::WrapLink);

    EXPECT_EQ("[文本](https://example.com)", surface.content);
    EXPECT_EQ((SelectionRange{1, 3}), surface.range);
}

TEST_F(DetailsModeControllerTest, BoldCommandAfterWideTextCountsCharacters)
{
    controller.externalUpdate("日本 World");
    ASSERT_TRUE(open());
    surface.range = SelectionRange{3, 8};

    controller.runCommand(cmd::WrapBold);

    EXPECT_EQ("日本 **World**", controller.draft());
    EXPECT_EQ((SelectionRange{5, 10}), surface.range);
}

TEST_F(DetailsModeControllerTest, ContinueMarkupFallsThroughWhenDeclined)
{
    ASSERT_TRUE(open());
    EXPECT_EQ(KeyDisposition::FallThrough, controller.runCommand(cmd::ContinueMarkup));
    EXPECT_EQ("Hello", controller.draft());
}

TEST_F(DetailsModeControllerTest, ContinueMarkupUpdatesDraftWhenHandled)
{
    controller.externalUpdate("- item");
    ASSERT_TRUE(open());
    surface.range = SelectionRange::caret(6);

    EXPECT_EQ(KeyDisposition::Handled, controller.runCommand(cmd::ContinueMarkup));
    EXPECT_EQ("- item\n- ", controller.draft());
    EXPECT_EQ(SelectionRange::caret(9), surface.range);
}

TEST_F(DetailsModeControllerTest, ContinueMarkupOnEmptyItemEndsListWithoutNewline)
{
    controller.externalUpdate("- a\n- ");
    ASSERT_TRUE(open());
    surface.range = SelectionRange::caret(6);

    EXPECT_EQ(KeyDisposition::Handled, controller.runCommand(cmd::ContinueMarkup));
    EXPECT_EQ("- a\n", controller.draft());
    EXPECT_EQ(SelectionRange::caret(4), surface.range);
}

TEST_F(DetailsModeControllerTest, UnboundCommandsFallThrough)
{
    ASSERT_TRUE(open());
    EXPECT_EQ(KeyDisposition::FallThrough, controller.runCommand(cmd::Reload));
    EXPECT_EQ(KeyDisposition::FallThrough, controller.runCommand(0));
    EXPECT_TRUE(controller.isEditing());
}

TEST_F(DetailsModeControllerTest, DraftChangesOutsideSessionAreIgnored)
{
    controller.draftChanged("stray");
    EXPECT_FALSE(controller.session().hasDraft());
    EXPECT_EQ("Hello", controller.displayedValue());
}
