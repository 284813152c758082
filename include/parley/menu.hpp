// Menu: a Question whose answer is one of a list of items
#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "parley/question.hpp"
#include "parley/text_layout.hpp"

namespace parley {

class Session;

// Called with the owning session, the selected item name and, for shell
// menus, the rest of the command line.
using MenuAction = std::function<Answer(Session&, const std::string&, const std::string&)>;

struct MenuItem {
    std::string name;
    MenuAction action;
    std::optional<std::string> help;
};

enum class MenuIndex { Number, Letter, None, Custom };
enum class SelectBy { Index, Name, IndexOrName };
enum class MenuLayout { List, OneLine, MenuOnly, Custom };

class PARLEY_API Menu : public Question {
public:
    Menu();

    // Add an item. An item without action selects to its own name.
    void AddChoice(const std::string& name, MenuAction action = nullptr,
                   std::optional<std::string> help = std::nullopt);
    // Add several items sharing one action.
    void AddChoices(const std::vector<std::string>& names, MenuAction action = nullptr);
    // Add an item that is selectable but never listed.
    void AddHiddenChoice(const std::string& name, MenuAction action = nullptr,
                         std::optional<std::string> help = std::nullopt);
    // Help text for a shell topic; enables the built-in "help" command.
    void SetHelp(const std::string& topic, const std::string& text) { help_[topic] = text; }

    void SetIndex(MenuIndex index) { index_ = index; }
    void SetIndex(std::string marker) { index_ = MenuIndex::Custom; index_marker_ = std::move(marker); }
    void SetIndexSuffix(std::string suffix) { index_suffix_ = std::move(suffix); }
    void SetSelectBy(SelectBy by) { select_by_ = by; }
    void SetFlow(ListMode flow) { flow_ = flow; }
    void SetListOption(std::optional<std::string> option) { list_option_ = std::move(option); }
    void SetHeader(std::optional<std::string> header) { header_ = std::move(header); }
    void SetPrompt(std::string prompt) { prompt_ = std::move(prompt); }
    void SetLayout(MenuLayout layout) { layout_ = layout; }
    void SetLayout(std::string template_text) { layout_ = MenuLayout::Custom; layout_template_ = std::move(template_text); }
    void SetShell(bool shell) { shell_ = shell; }
    void SetNilOnHandled(bool on) { nil_on_handled_ = on; }

    const std::vector<MenuItem>& items() const { return items_; }
    bool shell() const { return shell_; }
    const std::optional<std::string>& header() const { return header_; }
    const std::string& prompt() const { return prompt_; }
    ListMode flow() const { return flow_; }

    // Installs the hidden help command for shell menus with help topics.
    // Session::Choose calls this before asking.
    void Finalize();

    // Strings accepted as answers: indexes, names or both per select_by.
    std::vector<std::string> Options() const;
    // Listed items with their index markers ("1. apple").
    std::vector<std::string> DisplayItems() const;

    // Normal menus: one option by completion. Shell menus: a two-element
    // sequence [option, remainder of the line].
    ConvertOutcome Convert(const std::string& answer) const override;

    // Run the selected item's action or return its name. Throws
    // ParleyError(Lookup) when nothing matches.
    Answer Select(Session& session, const std::string& selection,
                  const std::string& details = "") const;

    std::string Render() const override;
    void FillTemplate(TemplateContext& context) const override;

    static std::string LetterIndex(size_t position);

protected:
    std::string TypeName() const override;
    std::string CompletionCandidates() const override;

private:
    std::vector<MenuItem> AllItems() const;

    std::vector<MenuItem> items_;
    std::vector<MenuItem> hidden_items_;
    std::map<std::string, std::string> help_;

    MenuIndex index_ = MenuIndex::Number;
    std::string index_marker_;
    std::string index_suffix_ = ". ";
    SelectBy select_by_ = SelectBy::IndexOrName;
    ListMode flow_ = ListMode::Rows;
    std::optional<std::string> list_option_;
    std::optional<std::string> header_;
    std::string prompt_ = "?  ";
    MenuLayout layout_ = MenuLayout::List;
    std::string layout_template_;
    bool shell_ = false;
    bool nil_on_handled_ = false;
};

} // namespace parley
