/**
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include <CLI11.hpp>

#include <iostream>
#include <sstream>

#include "read/reader.h"
#include "read/tsv_exporter.h"
#include "utils/logger_public.h"
#include "utils/utils.h"

using namespace simplevcf::vcf;

/** Arguments/params for the schema command. */
struct SchemaParams {
  std::string uri;
  std::string index_uri;
  std::string log_level;
  std::string log_file;
  bool format_fields = false;
  bool samples = false;
};

//==================================================================
// Command functions (do_*)
//==================================================================

void config_to_log(const CLI::App& cmd) {
  LOG_INFO("Version:\n{}", utils::version_info());
  LOG_INFO("Command options:\n{}", cmd.config_to_str(true));
}

/** Schema. */
void do_schema(const SchemaParams& args, const CLI::App& cmd) {
  LOG_TRACE("Starting schema command.");
  config_to_log(cmd);

  ReadParams params;
  params.uri = args.uri;
  params.index_uri = args.index_uri;

  Reader reader;
  reader.set_all_params(params);
  reader.open();

  if (args.samples) {
    for (const auto& s : reader.header().sample_names())
      std::cout << s << "\n";
  } else {
    TSVExporter exporter(&std::cout);
    exporter.export_table(
        args.format_fields ? reader.read_sample_schema() :
                             reader.read_info_schema());
  }
  std::cout.flush();
  LOG_TRACE("Finished schema command.");
}

/** Export. */
void do_export(const ReadParams& args, const CLI::App& cmd) {
  LOG_TRACE("Starting export command.");
  config_to_log(cmd);

  Reader reader;
  reader.set_all_params(args);
  reader.open();
  reader.export_tsv();
  LOG_TRACE("Finished export command.");
}

//==================================================================
// cli formatting
//==================================================================

// return string with newlines inserted near the specified width
std::string wrap(const std::string& input, const int width = 80) {
  std::stringstream ss;
  int col = 0;
  for (auto chr : input) {
    if (col >= width && chr == ' ') {
      ss << std::endl;
      col = 0;
    } else {
      ss << chr;
      col++;
    }
  }
  return ss.str();
}

// custom cli11 formater that line wraps option descriptions
class VcfFormatter : public CLI::Formatter {
 public:
  VcfFormatter(int column_width = 80)
      : Formatter()
      , column_width_(column_width) {
  }

  std::string make_option_desc(const CLI::Option* opt) const override {
    return wrap(opt->get_description(), column_width_);
  }

 private:
  int column_width_;
};

//==================================================================
// cli parser common options
//==================================================================

void add_input_options(
    CLI::App* cmd, std::string& uri, std::string& index_uri) {
  cmd->add_option("-i,--input", uri, "VCF file (plain, gzip or BGZF)")
      ->required();
  cmd->add_option(
      "--index",
      index_uri,
      "Tabix index of the VCF file. If not given, '<input>.tbi' is used "
      "when present.");
}

void add_logging_options(
    CLI::App* cmd, std::string& log_level, std::string& log_file) {
  cmd->add_option_function<std::string>(
         "--log-level",
         [&log_level](const std::string& value) {
           log_level = value;
           LOG_SET_LEVEL(value);
         },
         "Log message level")
      ->default_str("fatal")
      ->check(CLI::IsMember(
          {"fatal", "error", "warn", "info", "debug", "trace"},
          CLI::ignore_case));
  cmd->add_option_function<std::string>(
      "--log-file",
      [&log_file](const std::string& value) {
        log_file = value;
        LOG_SET_FILE(value);
      },
      "Log message output file");
}

//==================================================================
// cli parser subcommands (add_*)
//==================================================================

void add_schema(CLI::App& app) {
  auto args = std::make_shared<SchemaParams>();
  auto cmd = app.add_subcommand(
      "schema", "Prints the INFO or FORMAT field schema of a VCF file");

  cmd->set_help_flag("-h,--help")->group("");  // hide from help message
  add_input_options(cmd, args->uri, args->index_uri);
  cmd->add_flag(
      "--format",
      args->format_fields,
      "Print the FORMAT (sample) field schema instead of the INFO schema");
  cmd->add_flag("--samples", args->samples, "Print the sample names")
      ->excludes("--format");

  cmd->option_defaults()->group("Debug options");
  add_logging_options(cmd, args->log_level, args->log_file);

  // register function to implement this command
  cmd->callback([args, cmd]() { do_schema(*args, *cmd); });
}

void add_export(CLI::App& app) {
  auto args = std::make_shared<ReadParams>();
  auto cmd = app.add_subcommand(
      "export", "Exports the records of a VCF file as a TSV table");

  cmd->set_help_flag("-h,--help")->group("");  // hide from help message
  add_input_options(cmd, args->uri, args->index_uri);

  cmd->option_defaults()->group("Output options");
  cmd->add_option(
      "-o,--output-path",
      args->output_path,
      "Path of the TSV file to write. Output goes to stdout if not given.");
  cmd->add_option(
      "--max-records",
      args->max_num_records,
      "Maximum number of records to export");

  cmd->option_defaults()->group("Record options");
  cmd->add_option(
      "-r,--region",
      args->region,
      "Region to export, in the format 'CHR', 'CHR:START' or "
      "'CHR:START-END' (1-based, inclusive)");
  cmd->add_option_function<std::string>(
      "--info-fields",
      [args](const std::string& value) {
        args->info_fields = utils::split(value, ",");
      },
      "CSV list of INFO fields to export. Defaults to all declared fields.");
  cmd->add_option_function<std::string>(
      "--sample-fields",
      [args](const std::string& value) {
        args->sample_fields = utils::split(value, ",");
      },
      "CSV list of FORMAT fields to export. Defaults to all declared "
      "fields. GT is always exported.");
  cmd->add_option_function<std::string>(
      "--samples",
      [args](const std::string& value) {
        args->samples = utils::split(value, ",");
      },
      "CSV list of samples to export. Defaults to all samples.");
  cmd->add_flag(
      "--include-unspecified",
      args->include_unspecified,
      "Also export fields and samples that were not selected");
  cmd->add_flag(
      "--strict",
      args->strict_fields,
      "Fail if a selected field or sample is not declared in the header");
  cmd->add_flag(
      "--allow-truncated-samples",
      args->allow_truncated_samples,
      "Accept sample columns that omit trailing FORMAT values");

  cmd->option_defaults()->group("Debug options");
  add_logging_options(cmd, args->log_level, args->log_file);

  // register function to implement this command
  cmd->callback([args, cmd]() { do_export(*args, *cmd); });
}

//==================================================================
// main
//==================================================================

int main(int argc, char** argv) {
  // column widths for help message
  int left_width = 40;
  int right_width = 80;

  CLI::App app{
      "SimpleVCF -- Flatten VCF records into tables.\n\n"
      "  This command-line utility prints the field schema of a VCF file and\n"
      "  exports its records, optionally restricted to a region, as TSV."};
  app.formatter(std::make_shared<VcfFormatter>(right_width));
  app.get_formatter()->column_width(left_width);
  app.failure_message(CLI::FailureMessage::help);
  app.require_subcommand(1, 1);
  app.option_defaults()->always_capture_default();

  // add subcommands
  add_schema(app);
  add_export(app);

  // add version option and subcommand
  app.add_flag_function(
      "-v,--version",
      [](int count) {
        std::cout << utils::version_info() << std::endl;
        exit(0);
      },
      "Print the version information and exit");
  auto sub =
      app.add_subcommand("version", "Print the version information and exit");
  sub->parse_complete_callback([]() {
    std::cout << utils::version_info() << std::endl;
    exit(0);
  });

  try {
    CLI11_PARSE(app, argc, argv);
  } catch (const std::exception& e) {
    LOG_FATAL("Exception: {}", e.what());
  }

  return 0;
}
