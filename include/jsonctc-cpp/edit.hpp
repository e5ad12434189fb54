/// @file edit.hpp
/// @brief Minimal text edits for changing a value inside JSONC text.
///
/// Editors compute splices against the source text so that everything not
/// covered by the change (comments, whitespace, trailing commas) survives.

#pragma once

#include <jsonctc-cpp/path.hpp>
#include <jsonctc-cpp/value.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonctc_cpp {

/// A single splice: replace @p length bytes at @p offset with @p content.
struct TextEdit {
    std::size_t offset{0};
    std::size_t length{0};
    std::string content;

    auto operator==(const TextEdit& other) const -> bool = default;
};

/// Apply a batch of non-overlapping edits computed against @p text.
///
/// Edits are sorted by offset and applied from the end so earlier offsets
/// stay valid. Insertions at the same offset keep their relative order.
/// @throws Exception with ErrorKind::edit_failed on overlap or an edit
///         outside the text.
auto apply_edits(std::string_view text, std::vector<TextEdit> edits) -> std::string;

/// How freshly written values and whitespace are laid out.
struct FormattingOptions {
    std::size_t tab_size{2};
    bool insert_spaces{true};
    std::string eol{"\n"};
    bool insert_final_newline{true};
    /// Formatter only: keep the source's line breaks between tokens.
    bool keep_lines{false};
};

/// Computes the edits that set or delete the value at a path.
class PathEditor {
public:
    virtual ~PathEditor() = default;

    /// Edits that make @p path hold @p value.
    virtual auto edit_for_set(std::string_view text, const Path& path, const Json& value) const
        -> std::vector<TextEdit> = 0;

    /// Edits that remove the value at @p path. Empty if it does not exist.
    virtual auto edit_for_delete(std::string_view text, const Path& path) const
        -> std::vector<TextEdit> = 0;
};

/// Path editor for object properties.
///
/// Replaces the byte range of an existing value, inserts new properties
/// after the last existing one, and creates missing intermediate objects.
/// Paths that reach into an array are rejected with invalid_operation;
/// wrap this editor in an ArrayEditor to handle them.
class PropertyEditor : public PathEditor {
public:
    explicit PropertyEditor(FormattingOptions formatting = {});

    auto edit_for_set(std::string_view text, const Path& path, const Json& value) const
        -> std::vector<TextEdit> override;

    auto edit_for_delete(std::string_view text, const Path& path) const
        -> std::vector<TextEdit> override;

    auto formatting() const noexcept -> const FormattingOptions& { return formatting_; }

private:
    FormattingOptions formatting_;
};

/// Path editor that handles array elements itself and delegates the rest.
///
/// Elements in range are replaced or removed in place, so comments on
/// neighbouring elements survive. Appends past the end and edits nested
/// inside an element rewrite the whole array through the delegate.
class ArrayEditor : public PathEditor {
public:
    explicit ArrayEditor(std::shared_ptr<const PathEditor> delegate);

    auto edit_for_set(std::string_view text, const Path& path, const Json& value) const
        -> std::vector<TextEdit> override;

    auto edit_for_delete(std::string_view text, const Path& path) const
        -> std::vector<TextEdit> override;

private:
    auto edit(std::string_view text, const Path& path, const Json* value) const
        -> std::vector<TextEdit>;

    std::shared_ptr<const PathEditor> delegate_;
};

/// The default editor: an ArrayEditor over a PropertyEditor.
auto make_default_editor(FormattingOptions formatting = {}) -> std::shared_ptr<const PathEditor>;

/// Edits that set @p path to @p value, or delete it when @p value is empty.
auto modify(std::string_view text, const Path& path, const std::optional<Json>& value,
            const FormattingOptions& formatting = {}) -> std::vector<TextEdit>;

}  // namespace jsonctc_cpp
