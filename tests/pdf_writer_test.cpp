/*
 * This file is part of Letterpress.
 * Copyright (C) 2025 Luisma Peramato
 *
 * Letterpress is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Letterpress is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Letterpress. If not, see <https://www.gnu.org/licenses/>.
 */
#include "pdf_objects.h"
#include "pdf_text_commands.h"
#include "pdf_writer.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <zlib.h>

using namespace receipt_pdf_internal;

int main() {
  const std::filesystem::path outPath =
      std::filesystem::temp_directory_path() / "letterpress_pdf_writer_test.pdf";

  std::vector<PdfObject> objects;
  objects.push_back({"<< /Type /Catalog /Pages 2 0 R >>"});
  objects.push_back({"<< /Type /Pages /Kids [3 0 R] /Count 1 >>"});
  objects.push_back({"<< /Type /Page /Parent 2 0 R /MediaBox [0 0 100 100] /Contents 4 0 R >>"});
  objects.push_back({"<< /Length 0 >>\nstream\n\nendstream"});

  std::string error;
  if (!WritePdfDocument(outPath, objects, 1, error)) {
    std::cerr << error << std::endl;
    return 1;
  }

  std::ifstream in(outPath, std::ios::binary);
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (data.rfind("%PDF-1.4", 0) != 0 || data.find("xref") == std::string::npos ||
      data.find("%%EOF") == std::string::npos) {
    std::cerr << "Missing header, xref or EOF markers" << std::endl;
    return 1;
  }
  if (data != SerializePdfDocument(objects, 1)) {
    std::cerr << "File content differs from the serialized document" << std::endl;
    return 1;
  }

  // Every xref entry points at its object header.
  const size_t xref = data.find("xref\n");
  std::istringstream table(data.substr(xref));
  std::string line;
  std::getline(table, line); // xref
  std::getline(table, line); // 0 5
  std::getline(table, line); // free entry
  for (size_t i = 1; i <= objects.size(); ++i) {
    std::getline(table, line);
    const size_t offset = std::stoul(line.substr(0, 10));
    const std::string header = std::to_string(i) + " 0 obj";
    if (data.compare(offset, header.size(), header) != 0) {
      std::cerr << "xref entry " << i << " points at the wrong offset" << std::endl;
      return 1;
    }
  }
  std::filesystem::remove(outPath);

  if (WritePdfDocument(outPath, objects, 9, error) || error.empty()) {
    std::cerr << "Out-of-range catalog accepted" << std::endl;
    return 1;
  }
  error.clear();
  if (WritePdfDocument(outPath.parent_path() / "letterpress_missing_dir" / "x.pdf",
                       objects, 1, error) ||
      error.empty()) {
    std::cerr << "Write into a missing directory reported success" << std::endl;
    return 1;
  }

  // Deflated content inflates back to the original.
  const std::string content = "BT /F1 12 Tf 144 636 Td (Dear Jane) Tj ET\n";
  std::string compressed;
  if (!PdfDeflater::Compress(content, compressed, error)) {
    std::cerr << error << std::endl;
    return 1;
  }
  std::string inflated(content.size(), '\0');
  uLongf inflatedSize = inflated.size();
  if (uncompress(reinterpret_cast<Bytef *>(inflated.data()), &inflatedSize,
                 reinterpret_cast<const Bytef *>(compressed.data()),
                 compressed.size()) != Z_OK ||
      inflated != content) {
    std::cerr << "Deflated stream does not inflate to its input" << std::endl;
    return 1;
  }

  std::vector<PdfObject> streams;
  AppendContentStreamObject(streams, content, true);
  AppendContentStreamObject(streams, content, false);
  if (streams[0].body.find("/FlateDecode") == std::string::npos ||
      streams[1].body.find("/FlateDecode") != std::string::npos ||
      streams[1].body.find("(Dear Jane)") == std::string::npos) {
    std::cerr << "Content stream filters are wrong" << std::endl;
    return 1;
  }

  FloatFormatter fmt(2);
  if (fmt.Format(-0.001) != "0.00" || fmt.Format(612) != "612.00") {
    std::cerr << "Unexpected number formatting" << std::endl;
    return 1;
  }

  // Text run serialization.
  {
    std::ostringstream out;
    TextRun run;
    run.x = 144.0;
    run.y = 636.0;
    run.winAnsi = "Hi (x)\\";
    run.fontKey = "F2";
    AppendTextRun(out, fmt, run);
    const std::string expected =
        "BT\n/F2 12.00 Tf\n0 0 0 rg\n144.00 636.00 Td\n(Hi \\(x\\)\\\\) Tj\nET\n";
    if (out.str() != expected) {
      std::cerr << "Unexpected text run: " << out.str() << std::endl;
      return 1;
    }

    std::ostringstream skewed;
    run.skew = true;
    run.winAnsi = "\x95";
    AppendTextRun(skewed, fmt, run);
    if (skewed.str().find("1 0 0.20 1 144.00 636.00 Tm\n(\\225) Tj") == std::string::npos) {
      std::cerr << "Unexpected skewed run: " << skewed.str() << std::endl;
      return 1;
    }
  }
  return 0;
}
