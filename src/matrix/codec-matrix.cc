// matrix/codec-matrix.cc

// Copyright 2009-2011  Lukas Burget;  Ondrej Glembek;  Go Vivace Inc.;
//                      Microsoft Corporation;  Saarland University;
//                      Yanmin Qian;  Petr Schwarz;  Jan Silovsky;
//                      Haihua Xu
// Copyright 2026  slotcodec authors

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#include <algorithm>
#include <cmath>

#include "matrix/codec-matrix.h"

namespace slotcodec {

template<typename Real>
void Matrix<Real>::SetZero() {
  std::fill(data_.begin(), data_.end(), Real(0));
}

template<typename Real>
void Matrix<Real>::Set(Real value) {
  std::fill(data_.begin(), data_.end(), value);
}

template<typename Real>
void Matrix<Real>::SetRowRange(MatrixIndexT r, MatrixIndexT c_begin,
                               MatrixIndexT num_cols, Real value) {
  SLOTCODEC_ASSERT(static_cast<UnsignedMatrixIndexT>(r) <
                   static_cast<UnsignedMatrixIndexT>(num_rows_));
  SLOTCODEC_ASSERT(c_begin >= 0 && num_cols >= 0 &&
                   c_begin + num_cols <= num_cols_);
  Real *row = &data_[static_cast<size_t>(r) * num_cols_];
  std::fill(row + c_begin, row + c_begin + num_cols, value);
}

template<typename Real>
void Matrix<Real>::Resize(const MatrixIndexT rows,
                          const MatrixIndexT cols) {
  SLOTCODEC_ASSERT(rows >= 0 && cols >= 0);
  data_.assign(static_cast<size_t>(rows) * cols, Real(0));
  num_rows_ = rows;
  num_cols_ = cols;
}

template<typename Real>
Real Matrix<Real>::Sum() const {
  Real sum = 0.0;
  for (size_t i = 0; i < data_.size(); i++)
    sum += data_[i];
  return sum;
}

template<typename Real>
Real Matrix<Real>::RowMax(MatrixIndexT r, MatrixIndexT *col) const {
  if (num_cols_ == 0) SLOTCODEC_ERR << "Empty matrix row";
  const Real *row = RowData(r);
  Real ans = row[0];
  MatrixIndexT index = 0;
  for (MatrixIndexT c = 1; c < num_cols_; c++) {
    if (row[c] > ans) {
      ans = row[c];
      index = c;
    }
  }
  *col = index;
  return ans;
}

template<typename Real>
bool Matrix<Real>::ApproxEqual(const Matrix<Real> &other, float tol) const {
  if (num_rows_ != other.num_rows_ || num_cols_ != other.num_cols_)
    SLOTCODEC_ERR << "ApproxEqual: size mismatch.";
  double diff_sumsq = 0.0, this_sumsq = 0.0;
  for (size_t i = 0; i < data_.size(); i++) {
    double d = data_[i] - other.data_[i];
    diff_sumsq += d * d;
    this_sumsq += static_cast<double>(data_[i]) * data_[i];
  }
  return std::sqrt(diff_sumsq) <= tol * std::sqrt(this_sumsq);
}

template<typename Real>
bool Matrix<Real>::IsZero(Real cutoff) const {
  Real bound = 0.0;
  for (size_t i = 0; i < data_.size(); i++)
    bound = std::max(bound, static_cast<Real>(std::abs(data_[i])));
  return (bound <= cutoff);
}

template<typename Real>
void Matrix<Real>::Write(std::ostream &os) const {
  if (!os.good()) {
    SLOTCODEC_ERR << "Failed to write matrix to stream: stream not good";
  }
  if (num_cols_ == 0) {
    os << " [ ]\n";
  } else {
    os << " [";
    for (MatrixIndexT i = 0; i < num_rows_; i++) {
      os << "\n  ";
      for (MatrixIndexT j = 0; j < num_cols_; j++)
        os << (*this)(i, j) << " ";
    }
    os << "]\n";
  }
}

template<typename Real>
void Matrix<Real>::Read(std::istream &is) {
  // Each row is on its own line; the opening bracket may be followed by a
  // newline, and the closing bracket ends the last row.
  std::string token;
  is >> token;
  if (token != "[")
    SLOTCODEC_ERR << "Failed to read matrix from stream: expected \"[\", got \""
                  << token << "\"";
  std::vector<std::vector<Real> > rows;
  std::string line;
  bool closed = false;
  while (!closed && std::getline(is, line)) {
    std::istringstream line_is(line);
    std::vector<Real> row;
    std::string field;
    while (line_is >> field) {
      if (field == "]") {
        if (line_is >> field)
          SLOTCODEC_ERR << "Failed to read matrix: junk after \"]\": " << line;
        closed = true;
        break;
      }
      std::istringstream field_is(field);
      double value;
      if (!(field_is >> value) || !field_is.eof())
        SLOTCODEC_ERR << "Failed to read matrix: bad number \"" << field
                      << "\"";
      row.push_back(static_cast<Real>(value));
    }
    if (!row.empty()) rows.push_back(row);
  }
  if (!closed)
    SLOTCODEC_ERR << "Failed to read matrix from stream: missing \"]\"";
  if (rows.empty()) {
    Resize(0, 0);
    return;
  }
  MatrixIndexT num_cols = rows[0].size();
  Resize(rows.size(), num_cols);
  for (size_t r = 0; r < rows.size(); r++) {
    if (static_cast<MatrixIndexT>(rows[r].size()) != num_cols)
      SLOTCODEC_ERR << "Failed to read matrix: row " << r << " has "
                    << rows[r].size() << " columns, expected " << num_cols;
    std::copy(rows[r].begin(), rows[r].end(),
              data_.begin() + r * static_cast<size_t>(num_cols));
  }
}

template class Matrix<float>;
template class Matrix<double>;

}  // namespace slotcodec
