#include "utilities_test.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <stdexcept>

namespace ragdesk_tests {

std::filesystem::path TestUtilities::create_temp_test_dir(const std::string& name) {
  // Generate unique directory name using timestamp
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();

  auto dir = std::filesystem::temp_directory_path() / "ragdesk_tests" /
             (name + "_" + std::to_string(timestamp));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

std::filesystem::path TestUtilities::write_file(const std::filesystem::path& dir,
                                                const std::string& filename,
                                                const std::string& content) {
  auto path = dir / filename;
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw std::runtime_error("Could not create test file: " + path.string());
  }
  file << content;
  return path;
}

std::string TestUtilities::create_test_sentence(int number, size_t length) {
  std::string sentence = "Sentence " + std::to_string(number) + " ";
  if (sentence.size() + 1 > length) {
    throw std::invalid_argument("Sentence length too short for its tag");
  }
  sentence.append(length - 1 - sentence.size(), 'x');
  sentence.push_back('.');
  return sentence;
}

std::string TestUtilities::create_test_paragraph(int count, size_t length) {
  std::string paragraph;
  for (int i = 0; i < count; ++i) {
    if (i > 0) {
      paragraph.push_back(' ');
    }
    paragraph += create_test_sentence(i + 1, length);
  }
  return paragraph;
}

std::string TestUtilities::create_test_pdf(const std::vector<std::string>& page_texts) {
  std::vector<std::string> objects;
  const size_t page_count = page_texts.size();

  std::string kids;
  for (size_t i = 0; i < page_count; ++i) {
    kids += std::to_string(4 + 2 * i) + " 0 R ";
  }
  objects.push_back("<< /Type /Catalog /Pages 2 0 R >>");
  objects.push_back("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(page_count) +
                    " >>");
  objects.push_back("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>");

  for (size_t i = 0; i < page_count; ++i) {
    objects.push_back("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 612 792] "
                      "/Resources << /Font << /F1 3 0 R >> >> /Contents " +
                      std::to_string(5 + 2 * i) + " 0 R >>");
    std::string content =
        page_texts[i].empty() ? std::string() : "BT /F1 12 Tf 72 720 Td (" + page_texts[i] + ") Tj ET";
    objects.push_back("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content +
                      "\nendstream");
  }

  std::string pdf = "%PDF-1.4\n";
  std::vector<size_t> offsets;
  for (size_t i = 0; i < objects.size(); ++i) {
    offsets.push_back(pdf.size());
    pdf += std::to_string(i + 1) + " 0 obj\n" + objects[i] + "\nendobj\n";
  }

  const size_t xref_offset = pdf.size();
  pdf += "xref\n0 " + std::to_string(objects.size() + 1) + "\n";
  pdf += "0000000000 65535 f \n";
  for (size_t offset : offsets) {
    std::string padded = std::to_string(offset);
    padded.insert(0, 10 - padded.size(), '0');
    pdf += padded + " 00000 n \n";
  }
  pdf += "trailer\n<< /Size " + std::to_string(objects.size() + 1) + " /Root 1 0 R >>\n";
  pdf += "startxref\n" + std::to_string(xref_offset) + "\n%%EOF\n";
  return pdf;
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, int dimension) {
  std::vector<float> vector;
  vector.resize(dimension);

  std::hash<std::string> hasher;
  size_t seed_hash = hasher(seed_text);

  for (int i = 0; i < dimension; ++i) {
    vector[i] = static_cast<float>((seed_hash + i) % 1000) / 1000.0f;
  }

  return vector;
}

}  // namespace ragdesk_tests
