/**
 * csv2tsv - Convert CSV to TSV
 *
 * Reads CSV from the named files, or standard input, and writes TSV to
 * standard output. Quoted fields are unquoted, field delimiters become the
 * TSV delimiter, and TSV delimiters and newlines inside field data are
 * replaced so every record ends up on one line.
 */

#include "csv2tsv/dialect.h"
#include "csv2tsv/driver.h"
#include "csv2tsv/output_sink.h"
#include "csv2tsv/simd_info.h"

#include <getopt.h>

#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

constexpr const char* VERSION = "0.1.0";

// Long-only options
constexpr int OPT_HELP_VERBOSE = 1000;

void printVersion() {
  cout << "csv2tsv version " << VERSION << '\n';
  cout << csv2tsv::simd_summary() << '\n';
}

void printUsage(const char* prog) {
  cerr << "csv2tsv - Convert comma-separated text (CSV) to tab-separated format (TSV)\n\n";
  cerr << "Usage: " << prog << " [options] [file...]\n\n";
  cerr << "Records are read from files or standard input, converted records are\n";
  cerr << "written to standard output. Use '--help-verbose' for details of the CSV\n";
  cerr << "formats accepted.\n";
  cerr << "\nArguments:\n";
  cerr << "  file          Path to a CSV file, or '-' to read from stdin.\n";
  cerr << "                If omitted, reads from stdin.\n";
  cerr << "\nOptions:\n";
  cerr << "  -H, --header                  Treat the first line of each file as a header.\n";
  cerr << "                                Only the header of the first file is output.\n";
  cerr << "  -q, --quote CHR               Quoting character in CSV data (default: \")\n";
  cerr << "  -c, --csv-delim CHR           Field delimiter in CSV data (default: comma)\n";
  cerr << "  -t, --tsv-delim CHR           Field delimiter in TSV output (default: TAB)\n";
  cerr << "                                Delimiters: comma, tab, semicolon, pipe, or\n";
  cerr << "                                a single character\n";
  cerr << "  -r, --tab-replacement STR     Replacement for TSV field delimiters found in\n";
  cerr << "                                the CSV input (default: space)\n";
  cerr << "  -n, --newline-replacement STR Replacement for newlines found in the CSV\n";
  cerr << "                                input (default: space)\n";
  cerr << "  -h, --help                    Show this help message\n";
  cerr << "      --help-verbose            Show detailed help\n";
  cerr << "  -V, --version                 Show version information\n";
  cerr << "\nExamples:\n";
  cerr << "  " << prog << " data.csv > data.tsv\n";
  cerr << "  " << prog << " -H jan.csv feb.csv mar.csv > q1.tsv\n";
  cerr << "  " << prog << " -c semicolon -r '<TAB>' european.csv\n";
}

void printUsageVerbose(const char* prog) {
  printUsage(prog);
  cerr << "\nCSV formats accepted:\n";
  cerr << "  There is no single standard for CSV. Fields containing newlines or field\n";
  cerr << "  delimiters are placed in quotes, and a quote inside a quoted field is\n";
  cerr << "  written as a pair of quotes. In addition:\n";
  cerr << "  * Newlines are supported in quoted fields.\n";
  cerr << "  * Quotes are permitted in a non-quoted field. A field starting with a\n";
  cerr << "    quote must follow the quoting rules.\n";
  cerr << "  * Records can have different numbers of fields.\n";
  cerr << "  * CR, CRLF and LF newlines are accepted. Output uses LF.\n";
  cerr << "  * A newline is added if the input does not end with one.\n";
  cerr << "  * A UTF-8 Byte Order Mark (BOM) at the start of a file is removed.\n";
  cerr << "  * No whitespace trimming is done.\n";
  cerr << "\n  CSV correctness is not validated, but conversion stops with an error\n";
  cerr << "  on an improperly terminated quoted field.\n";
  cerr << "\n  UTF-8 input is assumed. Convert other encodings first.\n";
}

// Flush what has been converted so far; reports and returns false on failure.
bool flushOutput(csv2tsv::BufferedOutput& out) {
  try {
    out.flush();
    return true;
  } catch (const std::exception& e) {
    cerr << "Error: " << e.what() << endl;
    return false;
  }
}

int main(int argc, char* argv[]) {
  // Output is batched by BufferedOutput, so stdio buffering would only add a copy.
  setvbuf(stdout, nullptr, _IONBF, 0);

  static const struct option long_options[] = {
      {"header", no_argument, nullptr, 'H'},
      {"quote", required_argument, nullptr, 'q'},
      {"csv-delim", required_argument, nullptr, 'c'},
      {"tsv-delim", required_argument, nullptr, 't'},
      {"tab-replacement", required_argument, nullptr, 'r'},
      {"newline-replacement", required_argument, nullptr, 'n'},
      {"help", no_argument, nullptr, 'h'},
      {"help-verbose", no_argument, nullptr, OPT_HELP_VERBOSE},
      {"version", no_argument, nullptr, 'V'},
      {nullptr, 0, nullptr, 0}};

  csv2tsv::DriverOptions options;

  int c;
  try {
    while ((c = getopt_long(argc, argv, "Hq:c:t:r:n:hV", long_options, nullptr)) != -1) {
      switch (c) {
      case 'H':
        options.has_header = true;
        break;
      case 'q':
        if (string(optarg).length() != 1) {
          cerr << "Error: Quote character must be a single character\n";
          return 1;
        }
        options.transcode.csv.quote_char = optarg[0];
        break;
      case 'c':
        options.transcode.csv.delimiter = csv2tsv::parse_delimiter(optarg);
        break;
      case 't':
        options.transcode.tsv_delimiter = csv2tsv::parse_delimiter(optarg);
        break;
      case 'r':
        options.transcode.delimiter_replacement = optarg;
        break;
      case 'n':
        options.transcode.newline_replacement = optarg;
        break;
      case 'h':
        printUsage(argv[0]);
        return 0;
      case OPT_HELP_VERBOSE:
        printUsageVerbose(argv[0]);
        return 0;
      case 'V':
        printVersion();
        return 0;
      default:
        printUsage(argv[0]);
        return 1;
      }
    }

    options.transcode.validate();
  } catch (const std::invalid_argument& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  vector<string> files(argv + optind, argv + argc);

  csv2tsv::FileSink sink(stdout, "stdout");
  csv2tsv::BufferedOutput out(sink);

  try {
    csv2tsv::convert_files(files, options, out);
  } catch (const std::exception& e) {
    // Records converted before the failure are still written.
    flushOutput(out);
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return flushOutput(out) ? 0 : 1;
}
