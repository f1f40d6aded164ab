#include "main.hpp"
#include "base/base_button.hpp"
#include "base/controls.hpp"
#include "cards/info_card.hpp"
#include "cards/profile_card.hpp"
#include "cards/stat_card.hpp"
#include "core/image_cache.hpp"
#include "core/layout.hpp"
#include "core/overlay_manager.hpp"
#include "core/text.hpp"
#include "data/data_table.hpp"
#include "data/file_explorer.hpp"
#include "data/kanban_board.hpp"
#include "data/mini_chart.hpp"
#include "data/property_grid.hpp"
#include "data/timeline.hpp"
#include "data/tree_view.hpp"
#include "feedback/badge_label.hpp"
#include "feedback/empty_state.hpp"
#include "feedback/notification_toast.hpp"
#include "feedback/snackbar.hpp"
#include "feedback/status_chip.hpp"
#include "forms/date_range_picker.hpp"
#include "forms/slider.hpp"
#include "forms/tag_input.hpp"
#include "forms/toggle_switch.hpp"
#include "navigation/breadcrumb_bar.hpp"
#include "navigation/command_palette.hpp"
#include "navigation/pagination.hpp"
#include "navigation/sidebar_nav.hpp"
#include "navigation/tab_bar.hpp"
#include "style/theme_manager.hpp"
#include "user/chat_bubble.hpp"
#include "user/comment_thread.hpp"
#include "user/rating_star.hpp"
#include "user/reaction_bar.hpp"
#include "user/user_avatar.hpp"
#include "user/user_list.hpp"
#include "utility/clipboard_history.hpp"
#include "utility/global_search.hpp"
#include "utility/quick_settings_panel.hpp"
#include "utility/shortcut_helper.hpp"
#include <SDL.h>
#include <SDL_image.h>
#include <SDL_ttf.h>
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {
constexpr Uint32 FRAME_MS = 1000 / 60;

// Vertical page inside a scroll area.
std::unique_ptr<ScrollArea> make_page(BoxLayout*& content) {
	auto box = std::make_unique<BoxLayout>(BoxLayout::Direction::Vertical, 16);
	box->set_margins(20);
	content = box.get();
	return std::make_unique<ScrollArea>(std::move(box));
}

BoxLayout* add_row(BoxLayout& page, int spacing = 16) {
	return page.add_widget(std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, spacing));
}

void add_heading(BoxLayout& page, const std::string& text) {
	page.add_widget(std::make_unique<Label>(text, "heading"));
}

std::unique_ptr<Widget> build_base_page() {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "Buttons");
	BoxLayout* buttons = add_row(*page, 8);
	buttons->add_widget(std::make_unique<BaseButton>("Primary", ButtonVariant::Primary));
	buttons->add_widget(std::make_unique<BaseButton>("Secondary", ButtonVariant::Secondary));
	buttons->add_widget(std::make_unique<BaseButton>("Delete", ButtonVariant::Destructive));
	buttons->add_widget(std::make_unique<BaseButton>("Ghost", ButtonVariant::Ghost));
	auto* loading = buttons->add_widget(std::make_unique<BaseButton>("Load", ButtonVariant::Default));
	loading->set_on_clicked([loading]() { loading->set_loading(true); });
	buttons->add_widget(std::make_unique<IconButton>("settings"));
	buttons->add_stretch();

	add_heading(*page, "Inputs");
	page->add_widget(std::make_unique<TextBox>(std::string{}, "Type something..."));
	page->add_widget(std::make_unique<Checkbox>("Remember me", true));
	page->add_widget(std::make_unique<Dropdown>(std::vector<std::string>{ "Small", "Medium", "Large" }, 1, "Size"));
	page->add_widget(std::make_unique<ProgressBar>(65));
	return scroll;
}

std::unique_ptr<Widget> build_cards_page() {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "Statistics");
	BoxLayout* stats = add_row(*page);
	stats->add_widget(std::make_unique<StatCard>("Revenue", "12,480", "$", Trend::Up, "+8.2%"), 1);
	stats->add_widget(std::make_unique<MetricCard>("Uptime", "99.9", "%", Trend::Flat, 99.9), 1);
	stats->add_widget(std::make_unique<ProgressStatCard>("Storage", "72", "100", "GB"), 1);

	add_heading(*page, "Information");
	BoxLayout* info = add_row(*page);
	info->add_widget(std::make_unique<InfoCard>("Release notes", "Version 2.1 adds docking panels and a command palette.",
	                                            "info"), 1);
	info->add_widget(std::make_unique<StatusCard>("Build", "success", "All checks passed."), 1);
	info->add_widget(std::make_unique<ProfileCard>("Ada Lovelace", "Engineer"), 1);
	return scroll;
}

std::unique_ptr<Widget> build_feedback_page(ToastManager& toasts, SnackbarManager& snackbars) {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "Notifications");
	BoxLayout* row = add_row(*page, 8);
	auto* info = row->add_widget(std::make_unique<BaseButton>("Info toast", ButtonVariant::Secondary));
	info->set_on_clicked([&toasts]() { toasts.show_info("Heads up", "This is an informational toast."); });
	auto* error = row->add_widget(std::make_unique<BaseButton>("Error toast", ButtonVariant::Destructive));
	error->set_on_clicked([&toasts]() { toasts.show_error("Upload failed", "The server did not respond."); });
	auto* snack = row->add_widget(std::make_unique<BaseButton>("Snackbar", ButtonVariant::Default));
	snack->set_on_clicked([&snackbars, &toasts]() {
		snackbars.show_undo_snackbar("Item deleted", [&toasts]() { toasts.show_success("Restored"); });
	});
	row->add_stretch();

	add_heading(*page, "Status");
	auto* chips = page->add_widget(std::make_unique<StatusChipGroup>());
	chips->add_chip("Online", "success");
	chips->add_chip("Pending", "warning");
	chips->add_chip("Failed", "error");
	chips->add_chip("Draft", "neutral", true);
	BoxLayout* badges = add_row(*page, 12);
	badges->add_widget(std::make_unique<BadgedWidget>(std::make_unique<IconButton>("bell"), 3));
	badges->add_widget(std::make_unique<BadgedWidget>(std::make_unique<IconButton>("mail"), 120));
	badges->add_stretch();
	page->add_widget(std::make_unique<NoDataEmptyState>("projects"));
	return scroll;
}

std::unique_ptr<Widget> build_forms_page() {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "Controls");
	page->add_widget(std::make_unique<ToggleSwitch>(true, "Notifications"));
	page->add_widget(std::make_unique<Slider>(0, 100, 40, "Volume"));
	page->add_widget(std::make_unique<SliderWithInput>(0, 200, 120, "px"));
	page->add_widget(std::make_unique<RangeSlider>(0, 100, 25, 75));
	add_heading(*page, "Tags and dates");
	page->add_widget(std::make_unique<TagInput>("Add tags...",
	                                            std::vector<std::string>{ "design", "backend", "frontend", "docs" }));
	page->add_widget(std::make_unique<DateRangePicker>());
	return scroll;
}

std::unique_ptr<Widget> build_navigation_page() {
	auto root = std::make_unique<BoxLayout>(BoxLayout::Direction::Horizontal, 0);
	auto* sidebar = root->add_widget(std::make_unique<SidebarNav>("Workspace"));
	sidebar->add_section("Main");
	sidebar->add_item("home", "Home", "home", "Main");
	sidebar->add_item("inbox", "Inbox", "mail", "Main");
	sidebar->add_item("team", "Team", "users", "Main");
	sidebar->add_section("Settings", false);
	sidebar->add_item("prefs", "Preferences", "settings", "Settings");

	BoxLayout* page = nullptr;
	root->add_widget(make_page(page), 1);
	auto* crumbs = page->add_widget(std::make_unique<BreadcrumbBar>());
	crumbs->set_paths({ "Home", "Projects", "WidgetKit", "Navigation" });
	sidebar->set_on_item_clicked([crumbs](const std::string& id) { crumbs->set_paths({ "Home", id }); });
	page->add_widget(std::make_unique<Pagination>(12, 3));
	return root;
}

std::unique_ptr<Widget> build_data_page(SnackbarManager& snackbars) {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "Charts");
	BoxLayout* charts = add_row(*page);
	charts->add_widget(std::make_unique<MiniChart>("Visitors", ChartType::Line,
	                                               std::vector<double>{ 12, 18, 9, 22, 30, 27, 35 }), 1);
	charts->add_widget(std::make_unique<MiniChart>("Orders", ChartType::Bar,
	                                               std::vector<double>{ 5, 8, 6, 11, 7 }), 1);
	charts->add_widget(std::make_unique<Sparkline>("Latency", std::vector<double>{ 120, 98, 110, 87, 92, 80 }), 1);

	add_heading(*page, "Table");
	auto* table = page->add_widget(std::make_unique<DataTable>(std::vector<std::string>{ "Name", "Role", "Status" }));
	table->set_data({ { "Ada", "Engineer", "Active" },
	                  { "Grace", "Admiral", "Away" },
	                  { "Linus", "Maintainer", "Active" },
	                  { "Margaret", "Director", "Offline" } });

	add_heading(*page, "Board");
	auto* board = page->add_widget(std::make_unique<KanbanBoard>());
	board->add_column("To Do", "todo");
	board->add_column("In Progress", "doing");
	board->add_column("Done", "done");
	board->add_card("todo", "Write docs", "Document the layout classes");
	board->add_card("todo", "Theme editor");
	board->add_card("doing", "Docking", "Drag panels between areas");
	board->add_card("done", "Command palette");
	board->set_on_card_moved([&snackbars](const std::string&, const std::string&, const std::string& to) {
		snackbars.show_snackbar("Card moved to " + to);
	});

	add_heading(*page, "Tree and properties");
	BoxLayout* row = add_row(*page);
	auto* tree = row->add_widget(std::make_unique<TreeView>(), 1);
	TreeItem* src = tree->add_folder("src");
	tree->add_item("main.cpp", src, "file");
	tree->add_item("layout.cpp", src, "file");
	tree->add_folder("tests");
	auto* grid = row->add_widget(std::make_unique<PropertyGrid>(), 1);
	grid->add_property("Name", "Button", PropertyType::Auto, "General");
	grid->add_property("Visible", true, PropertyType::Auto, "General");
	grid->add_property("Width", 120, PropertyType::Auto, "Geometry");

	add_heading(*page, "Files");
	auto* explorer = page->add_widget(std::make_unique<FileExplorer>());
	explorer->set_fixed_height(360);
	explorer->set_on_file_double_clicked([&snackbars](const std::string& path) {
		snackbars.show_snackbar("Open " + path);
	});

	auto* timeline = page->add_widget(std::make_unique<Timeline>());
	timeline->add_event("Project created", "Initial commit", 0, "success");
	timeline->add_event("First release", "Version 1.0 published", 0, "info");
	return scroll;
}

std::unique_ptr<Widget> build_user_page() {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	add_heading(*page, "People");
	BoxLayout* avatars = add_row(*page, 8);
	avatars->add_widget(std::make_unique<UserAvatar>("Ada Lovelace", std::string{}, 48, "online"));
	avatars->add_widget(std::make_unique<UserAvatar>("Grace Hopper", std::string{}, 48, "away"));
	avatars->add_widget(std::make_unique<RatingStar>(5, 3.5));
	avatars->add_stretch();
	auto* users = page->add_widget(std::make_unique<UserList>());
	users->add_user("Ada Lovelace", "Engineer", "ada@example.com", std::string{}, "online");
	users->add_user("Grace Hopper", "Admiral", "grace@example.com", std::string{}, "busy");
	page->add_widget(std::make_unique<ReactionBar>(std::vector<ReactionBar::Reaction>{ { "👍", 4 }, { "🎉", 2 } }));

	add_heading(*page, "Conversation");
	auto* chat = page->add_widget(std::make_unique<ChatContainer>());
	chat->set_fixed_height(260);
	chat->add_message("Did the build pass?", "Grace");
	chat->add_message("Yes, all green.", "Me", true);
	auto* thread = page->add_widget(std::make_unique<CommentThread>());
	const std::string first = thread->add_comment("Ada", "The new layout looks great.");
	thread->add_comment("Linus", "Agreed, ship it.", first);
	return scroll;
}

std::unique_ptr<Widget> build_utility_page(ToastManager& toasts) {
	BoxLayout* page = nullptr;
	auto scroll = make_page(page);
	auto* search = page->add_widget(std::make_unique<GlobalSearch>());
	search->add_provider("Widgets", [](const std::string& query) {
		static const std::vector<std::string> names = { "Button", "Card", "Chart", "Slider", "Table",
		                                                "Toast", "Tree", "Timeline" };
		std::vector<SearchResult> results;
		const std::string q = wk_text::to_lower(query);
		for (const auto& n : names) {
			if (wk_text::to_lower(n).find(q) != std::string::npos) {
				SearchResult r;
				r.title = n;
				r.description = "Widget";
				r.score = 100.0 * static_cast<double>(q.size()) / static_cast<double>(n.size());
				results.push_back(r);
			}
		}
		return results;
	});
	search->set_on_result_selected([&toasts](const std::string&, const SearchResult& r) {
		toasts.show_info("Selected", r.title);
	});

	BoxLayout* row = add_row(*page);
	auto* settings = row->add_widget(std::make_unique<QuickSettingsPanel>("Quick Settings"), 1);
	settings->add_toggle("animations", "Animations", true, "Animate panels and popups");
	settings->add_slider("volume", "Volume", 0, 100, 60);
	settings->add_choice("density", "Density", { "Compact", "Comfortable", "Spacious" }, 1);
	settings->set_on_settings_applied([&toasts](const nlohmann::json& j) { toasts.show_success("Settings applied", j.dump()); });
	auto* clipboard = row->add_widget(std::make_unique<ClipboardHistory>(), 1);
	clipboard->add_item("git status");
	clipboard->add_item("https://example.com");
	page->add_widget(std::make_unique<ShortcutHelper>());
	page->add_widget(std::make_unique<ShortcutCapture>());
	return scroll;
}
}

GalleryApp::GalleryApp(const GalleryOptions& options, SDL_Renderer* renderer, int screen_w, int screen_h)
: options_(options), renderer_(renderer), screen_w_(screen_w), screen_h_(screen_h) {}

GalleryApp::~GalleryApp() {
	OverlayManager::instance().clear();
	ImageCache::instance().clear();
	wk_text::clear_cache();
}

void GalleryApp::init() {
	setup();
	loop();
}

void GalleryApp::apply_theme_options() {
	ThemeManager& themes = ThemeManager::instance();
	if (!options_.theme_file.empty()) {
		const std::vector<std::string> before = themes.available_themes();
		if (themes.load_theme_file(options_.theme_file)) {
			for (const auto& name : themes.available_themes()) {
				if (std::find(before.begin(), before.end(), name) == before.end()) {
					themes.set_theme(name);
					break;
				}
			}
			return;
		}
		std::cerr << "[Gallery] Falling back to the built-in theme\n";
	}
	themes.set_theme(options_.dark ? "dark" : "light");
}

void GalleryApp::toggle_theme() {
	ThemeManager& themes = ThemeManager::instance();
	themes.set_theme(themes.is_dark() ? "light" : "dark");
	std::cout << "[Gallery] Theme: " << themes.current_theme() << "\n";
}

void GalleryApp::setup() {
	try {
		apply_theme_options();
		OverlayManager::instance().set_screen_size(screen_w_, screen_h_);
		toasts_ = std::make_unique<ToastManager>();
		snackbars_ = std::make_unique<SnackbarManager>();
		palette_ = std::make_unique<QuickCommandPalette>();
		palette_->set_on_command_executed([this](const std::string& name, const nlohmann::json& data) {
			std::cout << "[Gallery] Command: " << name << "\n";
			if (data.value("action", std::string{}) == "settings") {
				root_->set_current_index(root_->count() - 1);
			}
			toasts_->show_info(name, "Command executed");
		});

		root_ = std::make_unique<TabContainer>();
		root_->add_tab("Base", build_base_page(), false, "grid");
		root_->add_tab("Cards", build_cards_page(), false, "file");
		root_->add_tab("Feedback", build_feedback_page(*toasts_, *snackbars_), false, "bell");
		root_->add_tab("Forms", build_forms_page(), false, "edit");
		root_->add_tab("Navigation", build_navigation_page(), false, "menu");
		root_->add_tab("Data", build_data_page(*snackbars_), false, "chart");
		root_->add_tab("Users", build_user_page(), false, "users");
		root_->add_tab("Utility", build_utility_page(*toasts_), false, "settings");
		root_->set_rect(SDL_Rect{ 0, 0, screen_w_, screen_h_ });
	} catch (const std::exception& e) {
		std::cerr << "[Gallery] Setup error: " << e.what() << "\n";
		throw;
	}
}

bool GalleryApp::handle_shortcut(const SDL_Event& e) {
	if (e.type != SDL_KEYDOWN) return false;
	if (e.key.keysym.sym == SDLK_F2) {
		toggle_theme();
		return true;
	}
	if (e.key.keysym.sym == SDLK_k && (e.key.keysym.mod & KMOD_CTRL)) {
		palette_->show_palette();
		return true;
	}
	return false;
}

void GalleryApp::resize(int w, int h) {
	screen_w_ = w;
	screen_h_ = h;
	OverlayManager::instance().set_screen_size(w, h);
	root_->set_rect(SDL_Rect{ 0, 0, w, h });
}

void GalleryApp::render() {
	const SDL_Color bg = ThemeManager::instance().color("background");
	SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, 255);
	SDL_RenderClear(renderer_);
	root_->render(renderer_);
	OverlayManager::instance().render(renderer_);
	SDL_RenderPresent(renderer_);
}

void GalleryApp::loop() {
	OverlayManager& overlays = OverlayManager::instance();
	while (!quit_) {
		const Uint32 start = SDL_GetTicks();
		SDL_Event e;
		while (SDL_PollEvent(&e)) {
			if (e.type == SDL_QUIT) {
				quit_ = true;
				break;
			}
			if (e.type == SDL_WINDOWEVENT && e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
				resize(e.window.data1, e.window.data2);
				continue;
			}
			if (overlays.handle_event(e)) continue;
			if (handle_shortcut(e)) continue;
			root_->handle_event(e);
		}
		root_->update();
		overlays.update();
		toasts_->update();
		snackbars_->update();
		render();
		const Uint32 elapsed = SDL_GetTicks() - start;
		if (elapsed < FRAME_MS) SDL_Delay(FRAME_MS - elapsed);
	}
}

GalleryOptions parse_gallery_options(int argc, char* argv[]) {
	GalleryOptions opts;
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i] ? argv[i] : "";
		if (arg == "--dark") {
			opts.dark = true;
		} else if (arg == "--theme" && i + 1 < argc) {
			opts.theme_file = argv[++i];
		} else if (arg == "--size" && i + 1 < argc) {
			const std::string size = argv[++i];
			const size_t x = size.find_first_of("xX");
			if (x == std::string::npos) {
				std::cerr << "[Gallery] Ignoring malformed size '" << size << "'\n";
				continue;
			}
			const int w = std::atoi(size.substr(0, x).c_str());
			const int h = std::atoi(size.substr(x + 1).c_str());
			if (w < 320 || h < 240) {
				std::cerr << "[Gallery] Ignoring size '" << size << "'\n";
				continue;
			}
			opts.width = w;
			opts.height = h;
		} else {
			std::cerr << "[Gallery] Unknown argument '" << arg << "'\n";
		}
	}
	return opts;
}

void run(SDL_Window* window, SDL_Renderer* renderer, int screen_w, int screen_h, const GalleryOptions& options) {
	(void)window;
	SDL_StartTextInput();
	GalleryApp app(options, renderer, screen_w, screen_h);
	app.init();
	SDL_StopTextInput();
}

int main(int argc, char* argv[]) {
	std::cout << "[Main] Starting widget gallery...\n";
	const GalleryOptions options = parse_gallery_options(argc, argv);
	if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) < 0) {
		std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n"; return 1;
	}
	if (SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "2") != SDL_TRUE) {
		SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "1");
	}
	if (TTF_Init() < 0) {
		std::cerr << "TTF_Init failed: " << TTF_GetError() << "\n"; SDL_Quit(); return 1;
	}
	if (!(IMG_Init(IMG_INIT_PNG | IMG_INIT_JPG) & (IMG_INIT_PNG | IMG_INIT_JPG))) {
		std::cerr << "IMG_Init failed: " << IMG_GetError() << "\n"; TTF_Quit(); SDL_Quit(); return 1;
	}
	SDL_Window* window = SDL_CreateWindow("WidgetKit Gallery", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
	                                      options.width, options.height, SDL_WINDOW_RESIZABLE);
	if (!window) {
		std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
		IMG_Quit(); TTF_Quit(); SDL_Quit(); return 1;
	}
	SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
	if (!renderer) {
		std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
		SDL_DestroyWindow(window); IMG_Quit(); TTF_Quit(); SDL_Quit(); return 1;
	}
	SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
	int screen_width = 0, screen_height = 0;
	SDL_GetRendererOutputSize(renderer, &screen_width, &screen_height);
	int status = 0;
	try {
		run(window, renderer, screen_width, screen_height, options);
	} catch (const std::exception& e) {
		std::cerr << "[Main] " << e.what() << "\n";
		status = 1;
	}
	SDL_DestroyRenderer(renderer);
	SDL_DestroyWindow(window);
	IMG_Quit(); TTF_Quit(); SDL_Quit();
	std::cout << "[Main] Gallery exited cleanly.\n";
	return status;
}
