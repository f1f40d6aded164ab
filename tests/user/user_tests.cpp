#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "base/base_button.hpp"
#include "base/base_popup.hpp"
#include "base/controls.hpp"
#include "style/styles.hpp"
#include "user/chat_bubble.hpp"
#include "user/comment_thread.hpp"
#include "user/profile_header.hpp"
#include "user/rating_star.hpp"
#include "user/reaction_bar.hpp"
#include "user/user_avatar.hpp"
#include "user/user_list.hpp"
#include "../test_support.hpp"

#include <string>
#include <vector>

using namespace wk_test;

namespace {
SDL_Point center(const SDL_Rect& r) {
    return SDL_Point{ r.x + r.w / 2, r.y + r.h / 2 };
}
}

TEST_CASE("Avatar initials and colours are derived from the name") {
    reset_environment();
    CHECK(UserAvatar::initials_for("John Ronald Smith") == "JS");
    CHECK(UserAvatar::initials_for("alice") == "A");
    CHECK(UserAvatar::initials_for("") == "?");
    CHECK(UserAvatar::initials_for("  ada   lovelace ") == "AL");

    CHECK(UserAvatar::palette_index("") == -1);
    const int idx = UserAvatar::palette_index("Grace Hopper");
    CHECK(idx >= 0);
    CHECK(idx < UserAvatar::kPaletteSize);
    CHECK(UserAvatar::palette_index("Grace Hopper") == idx);

    CHECK(wk::same_color(UserAvatar::status_color("online"), wk::parse_hex("#10B981")));
    CHECK(wk::same_color(UserAvatar::status_color("busy"), wk::parse_hex("#EF4444")));
    CHECK(wk::same_color(UserAvatar::status_color("somewhere"), UserAvatar::status_color("offline")));

    UserAvatar big("Big", "", 96);
    CHECK(big.status_dot_size() == 16);
    UserAvatar small("Small", "", 24);
    CHECK(small.status_dot_size() == 8);
}

TEST_CASE("Avatar group collapses extra avatars into a counter") {
    reset_environment();
    AvatarGroup group(2, 30);
    group.add_avatar("A");
    group.add_avatar("B");
    CHECK(group.overflow_avatar() == nullptr);
    group.add_avatar("C");
    group.add_avatar("D");
    CHECK(group.avatar_count() == 4);
    CHECK(group.visible_count() == 2);
    CHECK(group.overflow_count() == 2);
    REQUIRE(group.overflow_avatar() != nullptr);
    CHECK(group.preferred_width() == 30 + 2 * (30 - 10));
}

TEST_CASE("Chat container sends trimmed messages and shows typing") {
    reset_environment();
    ChatContainer chat;
    chat.set_rect(SDL_Rect{ 0, 0, 420, 480 });
    std::vector<std::string> sent;
    chat.set_on_message_sent([&](const std::string& text) { sent.push_back(text); });

    chat.input()->set_text("   ");
    chat.send_button()->click();
    CHECK(chat.message_count() == 0);

    chat.input()->set_text("  hello there ");
    chat.send_button()->click();
    REQUIRE(chat.message_count() == 1);
    CHECK(chat.message(0)->message() == "hello there");
    CHECK(chat.message(0)->sender() == "You");
    CHECK(chat.message(0)->is_own());
    CHECK(chat.input()->text().empty());
    CHECK(sent == std::vector<std::string>{ "hello there" });

    chat.add_message("Hi!", "Ann", false);
    CHECK(chat.message_count() == 2);
    CHECK_FALSE(chat.message(1)->is_own());

    chat.show_typing(true, "Ann");
    CHECK(chat.is_typing_shown());
    chat.show_typing(false);
    CHECK_FALSE(chat.is_typing_shown());

    chat.clear();
    CHECK(chat.message_count() == 0);
    CHECK(ChatBubble::max_bubble_width(400) == 280);
}

TEST_CASE("Typing indicator cycles its dots") {
    reset_environment();
    TypingIndicator typing("Ann");
    CHECK(typing.is_animating());
    CHECK(typing.active_dot() == 0);
    advance(&typing, 520);
    CHECK(typing.active_dot() == 1);
    advance(&typing, 500);
    CHECK(typing.active_dot() == 2);
    typing.hide();
    CHECK_FALSE(typing.is_animating());
}

TEST_CASE("Rating star click sets and clears the rating") {
    reset_environment();
    RatingStar stars(5, 0.0);
    stars.set_rect(SDL_Rect{ 0, 0, stars.preferred_width(), 20 });
    std::vector<double> changes;
    stars.set_on_rating_changed([&](double v) { changes.push_back(v); });

    const SDL_Point third = center(stars.star_rect(2));
    click_at(stars, third.x, third.y);
    CHECK(stars.rating() == doctest::Approx(3.0));
    click_at(stars, third.x, third.y);
    CHECK(stars.rating() == doctest::Approx(0.0));
    CHECK(changes.size() == 2);

    stars.handle_event(mouse_move(third.x, third.y));
    CHECK(stars.hover_rating() == doctest::Approx(3.0));
    CHECK(stars.displayed_rating() == doctest::Approx(3.0));

    stars.set_rating(7.0);
    CHECK(stars.rating() == doctest::Approx(5.0));
    stars.set_rating(2.4);
    CHECK(stars.rating() == doctest::Approx(2.0));
}

TEST_CASE("Rating star supports half stars and read-only mode") {
    reset_environment();
    RatingStar stars(5, 0.0);
    stars.set_half_stars(true);
    stars.set_rect(SDL_Rect{ 0, 0, stars.preferred_width(), 20 });
    const SDL_Rect second = stars.star_rect(1);
    click_at(stars, second.x + 2, second.y + second.h / 2);
    CHECK(stars.rating() == doctest::Approx(1.5));

    stars.set_rating(2.26);
    CHECK(stars.rating() == doctest::Approx(2.5));

    stars.set_read_only(true);
    const SDL_Point last = center(stars.star_rect(4));
    CHECK_FALSE(click_at(stars, last.x, last.y));
    CHECK(stars.rating() == doctest::Approx(2.5));
}

TEST_CASE("Reaction bar toggles own reactions and never goes negative") {
    reset_environment();
    ReactionBar bar({ { "👍", 2 }, { "🎉", 1 } });
    std::vector<std::string> added;
    std::vector<std::string> removed;
    bar.set_on_reaction_added([&](const std::string& e) { added.push_back(e); });
    bar.set_on_reaction_removed([&](const std::string& e) { removed.push_back(e); });

    bar.toggle_reaction("👍");
    CHECK(bar.count("👍") == 3);
    CHECK(bar.has_reacted("👍"));
    bar.toggle_reaction("👍");
    CHECK(bar.count("👍") == 2);
    CHECK_FALSE(bar.has_reacted("👍"));
    CHECK(added == std::vector<std::string>{ "👍" });
    CHECK(removed == std::vector<std::string>{ "👍" });

    bar.remove_reaction("🎉", 5);
    CHECK(bar.count("🎉") == 0);
    CHECK(bar.reactions().size() == 1);

    bar.add_reaction("🔥", 0);
    CHECK(bar.count("🔥") == 0);

    bar.set_rect(SDL_Rect{ 0, 0, 300, 30 });
    const SDL_Point chip = center(bar.chip_rect("👍"));
    click_at(bar, chip.x, chip.y);
    CHECK(bar.count("👍") == 3);
}

TEST_CASE("Reaction picker adds a reaction once") {
    reset_environment();
    ReactionBar bar;
    bar.set_rect(SDL_Rect{ 0, 0, 300, 30 });
    const SDL_Point add = center(bar.add_rect());
    click_at(bar, add.x, add.y);
    REQUIRE(bar.picker() != nullptr);
    CHECK(bar.picker()->action_count() == ReactionBar::picker_emojis().size());
    bar.picker()->trigger(0);
    CHECK(bar.count(ReactionBar::picker_emojis()[0]) == 1);
    CHECK(bar.has_reacted(ReactionBar::picker_emojis()[0]));

    bar.show_picker();
    bar.picker()->trigger(0);
    CHECK(bar.count(ReactionBar::picker_emojis()[0]) == 1);
}

TEST_CASE("User list filters, selects and reports actions") {
    reset_environment();
    UserList list;
    list.set_rect(SDL_Rect{ 0, 0, 360, 400 });
    UserListItem* ann = list.add_user("Ann Lee", "Engineer", "ann@example.com", "", "online");
    list.add_user("Bob Stone", "Designer", "bob@example.com");
    list.add_user("Cleo Park", "Engineering Manager", "cleo@corp.io");
    CHECK(list.user_count() == 3);

    list.filter("ENGINEER");
    CHECK(list.visible_users() == std::vector<std::string>{ "Ann Lee", "Cleo Park" });
    list.filter("corp.io");
    CHECK(list.visible_users() == std::vector<std::string>{ "Cleo Park" });
    list.filter("");
    CHECK(list.visible_users().size() == 3);

    std::vector<std::string> selected;
    list.set_on_user_selected([&](const std::string& name) { selected.push_back(name); });
    const SDL_Point p = center(ann->rect());
    click_at(list, p.x, p.y);
    CHECK(list.selected_user() == "Ann Lee");
    CHECK(ann->is_selected());
    CHECK(selected == std::vector<std::string>{ "Ann Lee" });

    std::string action_user;
    std::string action;
    list.set_on_user_action([&](const std::string& u, const std::string& a) {
        action_user = u;
        action = a;
    });
    BaseButton* message = ann->add_action("Send Message");
    CHECK(ann->action_button("send_message") == message);
    message->click();
    CHECK(action_user == "Ann Lee");
    CHECK(action == "send_message");
    CHECK(ann->remove_action("send_message"));
    CHECK(ann->action_count() == 0);

    CHECK(list.remove_user("Ann Lee"));
    CHECK(list.selected_user().empty());
    CHECK_FALSE(list.remove_user("Nobody"));
    CHECK(list.users() == std::vector<std::string>{ "Bob Stone", "Cleo Park" });
    list.clear_users();
    CHECK(list.user_count() == 0);
}

TEST_CASE("Comment relative time") {
    reset_environment();
    CHECK(CommentItem::relative_time(1000, 1030) == "just now");
    CHECK(CommentItem::relative_time(1000, 1000 + 5 * 60) == "5m ago");
    CHECK(CommentItem::relative_time(1000, 1000 + 3 * 3600 + 10) == "3h ago");
    CHECK(CommentItem::relative_time(1000, 1000 + 2 * 86400) == "2d ago");
}

TEST_CASE("Comment thread nests replies and counts comments") {
    reset_environment();
    CommentThread thread;
    thread.set_rect(SDL_Rect{ 0, 0, 480, 600 });
    CHECK(thread.count_text() == "0 comments");

    const std::string first = thread.add_comment("Ann", "First!");
    const std::string reply = thread.add_reply(first, "Bob", "Welcome");
    const std::string second = thread.add_comment("Cleo", "Second");
    CHECK(thread.count_text() == "3 comments");
    CHECK(thread.ordered_ids() == std::vector<std::string>{ first, reply, second });
    CHECK(thread.depth(reply) == 1);
    CHECK(thread.comment(reply)->indent() == CommentThread::kIndentStep);
    CHECK(thread.add_reply("missing", "X", "Y").empty());

    std::vector<std::pair<std::string, bool>> likes;
    thread.set_on_comment_liked([&](const std::string& id, bool liked) { likes.emplace_back(id, liked); });
    thread.comment(first)->like_button()->click();
    CHECK(thread.comment(first)->likes() == 1);
    CHECK(thread.comment(first)->like_button()->text() == "👍 1");
    thread.comment(first)->like_button()->click();
    CHECK(thread.comment(first)->likes() == 0);
    REQUIRE(likes.size() == 2);
    CHECK(likes[0].second);
    CHECK_FALSE(likes[1].second);

    std::vector<std::string> deleted;
    thread.set_on_comment_deleted([&](const std::string& id) { deleted.push_back(id); });
    thread.comment(first)->delete_button()->click();
    CHECK(thread.comment_count() == 3);
    thread.update();
    CHECK(thread.comment_count() == 1);
    CHECK(deleted == std::vector<std::string>{ reply, first });
    CHECK(thread.count_text() == "1 comment");

    thread.clear_comments();
    CHECK(thread.comment_count() == 0);
}

TEST_CASE("Comment thread posts from the form and the reply form") {
    reset_environment();
    CommentThread thread;
    thread.set_rect(SDL_Rect{ 0, 0, 480, 600 });
    std::vector<std::pair<std::string, std::string>> added;
    thread.set_on_comment_added([&](const std::string& parent, const std::string& text) {
        added.emplace_back(parent, text);
    });

    thread.form()->input()->set_text("  ");
    thread.form()->post_button()->click();
    CHECK(thread.comment_count() == 0);

    thread.form()->input()->set_text(" Looks good ");
    thread.form()->post_button()->click();
    REQUIRE(thread.comment_count() == 1);
    const std::string id = thread.ordered_ids().front();
    CHECK(thread.comment(id)->author() == CommentThread::kCurrentUser);
    CHECK(thread.comment(id)->content() == "Looks good");
    CHECK(thread.form()->input()->text().empty());

    thread.comment(id)->reply_button()->click();
    thread.update();
    CHECK(thread.reply_target() == id);
    thread.reply_form()->input()->set_text("Thanks");
    thread.reply_form()->post_button()->click();
    thread.update();
    CHECK(thread.reply_target().empty());
    REQUIRE(thread.replies(id).size() == 1);
    CHECK(thread.comment(thread.replies(id).front())->content() == "Thanks");

    REQUIRE(added.size() == 2);
    CHECK(added[0].first == "root");
    CHECK(added[1].first == id);
    CHECK(added[1].second == "Thanks");
}

TEST_CASE("Comment inline edit saves non-empty text") {
    reset_environment();
    CommentThread thread;
    thread.set_rect(SDL_Rect{ 0, 0, 480, 600 });
    const std::string id = thread.add_comment("Ann", "Original");
    std::string edited;
    thread.set_on_comment_edited([&](const std::string& cid, const std::string& text) { edited = cid + ":" + text; });

    CommentItem* item = thread.comment(id);
    item->edit_button()->click();
    CHECK(item->is_editing());
    CHECK(item->edit_button()->text() == "Cancel");
    item->editor()->set_text("   ");
    CHECK_FALSE(item->save_edit());
    CHECK(item->is_editing());
    item->editor()->set_text(" Updated ");
    CHECK(item->save_edit());
    CHECK_FALSE(item->is_editing());
    CHECK(item->content() == "Updated");
    CHECK(edited == id + ":Updated");

    item->start_edit();
    item->editor()->set_text("Discarded");
    item->cancel_edit();
    CHECK(item->content() == "Updated");
}

TEST_CASE("Profile header stats, actions and clicks") {
    reset_environment();
    ProfileHeader header("Ada Lovelace", "Mathematician", "", "Analytical engines.", "London");
    header.set_rect(SDL_Rect{ 0, 0, 640, header.height_for_width(640) });
    CHECK(header.height_for_width(640) > ProfileHeader::kBannerHeight);

    header.add_stat("Posts", 12);
    header.add_stat("Followers", "1.2k");
    header.add_stat("Posts", "13");
    CHECK(header.stats().size() == 2);
    CHECK(header.stat("Posts") == "13");
    CHECK(header.stat("Following").empty());

    std::vector<std::string> actions;
    header.set_on_action_clicked([&](const std::string& a) { actions.push_back(a); });
    header.add_action("Follow");
    header.add_action("Send Message", "", ButtonVariant::Secondary);
    header.action_button("send_message")->click();
    header.action_button("follow")->click();
    CHECK(actions == std::vector<std::string>{ "send_message", "follow" });
    CHECK(header.remove_action("follow"));
    CHECK(header.action_count() == 1);

    int edits = 0;
    header.set_on_edit_clicked([&]() { ++edits; });
    CHECK_FALSE(header.edit_button()->is_visible());
    header.set_editable(true);
    header.edit_button()->click();
    CHECK(edits == 1);

    int banner = 0;
    int avatar = 0;
    header.set_on_banner_clicked([&]() { ++banner; });
    header.set_on_avatar_clicked([&]() { ++avatar; });
    click_at(header, 600, 20);
    CHECK(banner == 1);
    const SDL_Point a = center(header.avatar_rect());
    click_at(header, a.x, a.y);
    CHECK(avatar == 1);
    CHECK(banner == 1);

    header.set_compact(true);
    CHECK(header.banner_rect().h == ProfileHeader::kCompactBannerHeight);
    CHECK(header.avatar_rect().w == ProfileHeader::kCompactAvatarSize);
}

TEST_CASE("User widgets render without errors") {
    reset_environment();
    SoftwareCanvas canvas;
    ProfileHeader header("Ada", "Countess");
    header.add_stat("Posts", 3);
    header.set_rect(SDL_Rect{ 0, 0, 640, 320 });
    header.render(canvas.renderer());

    CommentThread thread;
    thread.set_rect(SDL_Rect{ 0, 0, 480, 400 });
    thread.add_reply(thread.add_comment("Ann", "Hi"), "Bob", "Hello");
    thread.render(canvas.renderer());

    RatingStar stars(5, 3.5);
    stars.set_half_stars(true);
    stars.set_rating(3.5);
    stars.set_rect(SDL_Rect{ 0, 0, stars.preferred_width(), 20 });
    stars.render(canvas.renderer());

    ChatContainer chat;
    chat.set_rect(SDL_Rect{ 0, 0, 420, 400 });
    chat.add_message("A fairly long message that has to wrap across more than one line", "Ann", false);
    chat.render(canvas.renderer());
    CHECK(chat.message_count() == 1);
}
