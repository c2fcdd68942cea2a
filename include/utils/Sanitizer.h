#pragma once

#include <string>

namespace Sanitizer {

/**
 * @brief Check for tag-like substructures ("<b>", "</p>", "<br/>", "<!-- -->")
 * A tag starts with '<' followed by a letter, '/' or '!' and ends at the next '>'
 * with no '<' or '>' in between.
 */
bool containsMarkup(const std::string &text);

/**
 * @brief Reduce markup-wrapped text to plain text
 * Removes tags and decodes &nbsp; &amp; &lt; &gt; &quot; &#39; &apos;, repeating until
 * neither applies any more. The result never contains markup and stripping it again
 * returns it unchanged. Leading and trailing whitespace is trimmed.
 */
std::string stripMarkup(const std::string &text);

/**
 * @brief Trim ASCII whitespace from both ends
 */
std::string trim(const std::string &text);

} // namespace Sanitizer
