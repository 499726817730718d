/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <justifier.hpp>
#include <utils.hpp>
#include <glib.h>

#include <clocale>
#include <cstdio>
#include <iostream>
#include <optional>

namespace {

gboolean greedy = FALSE;
gboolean pad = FALSE;
gboolean stats = FALSE;
gboolean quiet = FALSE;

GOptionEntry option_entries[] = {
    {"greedy", 'g', 0, G_OPTION_ARG_NONE, &greedy, "Use greedy first fit line breaking", nullptr},
    {"pad", 'p', 0, G_OPTION_ARG_NONE, &pad, "Pad lines with spaces to the full width", nullptr},
    {"stats", 's', 0, G_OPTION_ARG_NONE, &stats, "Print length and slack of each line", nullptr},
    {"quiet", 'q', 0, G_OPTION_ARG_NONE, &quiet, "Do not print progress messages", nullptr},
    {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}};

void drop_message(const gchar *, GLogLevelFlags, const gchar *, gpointer) {}

int usage_error(const char *prog_name, const char *message) {
    g_printerr("%s: %s\n", prog_name, message);
    g_printerr("Run '%s --help' for usage.\n", prog_name);
    return 1;
}

std::optional<int64_t> parse_width(const char *arg, GError **err) {
    gint64 value = 0;
    if(!g_ascii_string_to_signed(arg, 10, 1, max_line_width, &value, err)) {
        return {};
    }
    return int64_t(value);
}

void warn_oversized(const Justifier &justifier) {
    for(size_t i = 0; i < justifier.num_words(); ++i) {
        if(justifier.word_length(i) > justifier.width()) {
            g_warning("Word %" G_GSIZE_FORMAT " is %" G_GINT64_FORMAT
                      " characters, longer than line width %" G_GINT64_FORMAT ".",
                      i,
                      gint64(justifier.word_length(i)),
                      gint64(justifier.width()));
        }
    }
}

void print_stats(const std::vector<std::string> &lines, const int64_t width) {
    for(const auto &l : lines) {
        const auto length = int64_t(utf8_length(l));
        printf("%s", l.c_str());
        for(int64_t i = length; i < width + 2; ++i) {
            printf(" ");
        }
        printf("%3" G_GINT64_FORMAT " %3" G_GINT64_FORMAT "\n",
               gint64(length),
               gint64(width - length));
    }
}

} // namespace

int main(int argc, char **argv) {
    setlocale(LC_ALL, "");
    // Standard output carries only the justified text.
    g_log_writer_default_set_use_stderr(TRUE);
    const char *prog_name = argc > 0 ? argv[0] : "justify";
    GError *err = nullptr;
    GOptionContext *context = g_option_context_new("WIDTH");
    g_option_context_set_summary(context,
                                 "Reads text from standard input and breaks it into lines of at "
                                 "most WIDTH characters, minimizing the sum of squared slack.");
    g_option_context_add_main_entries(context, option_entries, nullptr);
    const gboolean parsed = g_option_context_parse(context, &argc, &argv, &err);
    g_option_context_free(context);
    if(!parsed) {
        const int rc = usage_error(prog_name, err->message);
        g_error_free(err);
        return rc;
    }
    if(quiet) {
        g_log_set_handler(G_LOG_DOMAIN,
                          GLogLevelFlags(G_LOG_LEVEL_MESSAGE | G_LOG_LEVEL_INFO),
                          drop_message,
                          nullptr);
    }
    if(argc != 2) {
        return usage_error(prog_name, "expected exactly one argument, the line width");
    }
    const auto width = parse_width(argv[1], &err);
    if(!width) {
        const int rc = usage_error(prog_name, err->message);
        g_error_free(err);
        return rc;
    }

    g_message("Reading text from stdin.");
    auto input = read_words(std::cin);
    if(const auto *bad = std::get_if<InvalidUtf8>(&input)) {
        g_printerr("%s: invalid UTF-8 on input line %" G_GSIZE_FORMAT "\n",
                   prog_name,
                   bad->line_number);
        return 1;
    }
    const auto &words = std::get<std::vector<std::string>>(input);
    g_message("Read %" G_GSIZE_FORMAT " words.", words.size());

    Justifier justifier(words, *width);
    warn_oversized(justifier);
    const auto strategy = greedy ? BreakStrategy::Greedy : BreakStrategy::Optimal;
    const auto result = justifier.partition(strategy);
    if(const auto *e = std::get_if<JustifyError>(&result)) {
        g_printerr("%s: failed to justify text: %s\n", prog_name, error_text(*e));
        return 1;
    }
    const auto &partition = std::get<Partition>(result);
    g_debug("%s badness: %" G_GINT64_FORMAT,
            greedy ? "Greedy" : "Optimal",
            gint64(partition.total_badness));

    const auto lines =
        pad ? justifier.build_padded_lines(partition) : justifier.build_lines(partition);
    if(stats) {
        print_stats(lines, *width);
    } else {
        for(const auto &l : lines) {
            printf("%s\n", l.c_str());
        }
    }
    g_message("Text justified into %" G_GSIZE_FORMAT " lines.", lines.size());
    return 0;
}
