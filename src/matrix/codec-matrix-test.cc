// matrix/codec-matrix-test.cc

// Copyright 2009-2012  Microsoft Corporation;  Mohit Agarwal;  Lukas Burget;
//                      Ondrej Glembek;  Saarland University;  Haihua Xu;
//                      Go Vivace Inc.;  Jan Silovsky;  Yanmin Qian
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

#include <sstream>

#include "matrix/codec-matrix.h"

namespace slotcodec {

template<typename Real>
static void UnitTestResize() {
  Matrix<Real> M(3, 4);
  SLOTCODEC_ASSERT(M.NumRows() == 3 && M.NumCols() == 4);
  SLOTCODEC_ASSERT(M.IsZero());
  M(1, 2) = 5.0;
  M(2, 3) = -1.0;
  Matrix<Real> N(M);
  SLOTCODEC_ASSERT(N.ApproxEqual(M) && N.Sum() == 4.0);
  N.Resize(4, 4);
  SLOTCODEC_ASSERT(N.IsZero());
  N.Set(2.0);
  AssertEqual(N.Sum(), 32.0);
  N.SetZero();
  SLOTCODEC_ASSERT(N.IsZero());
}

template<typename Real>
static void UnitTestSetRowRange() {
  Matrix<Real> M(2, 4);
  M.SetRowRange(0, 2, 2, 3.0);
  SLOTCODEC_ASSERT(M(0, 0) == 0.0 && M(0, 1) == 0.0);
  SLOTCODEC_ASSERT(M(0, 2) == 3.0 && M(0, 3) == 3.0);
  SLOTCODEC_ASSERT(M(1, 2) == 0.0);
  M.SetRowRange(1, 0, 0, 7.0);  // empty range is a no-op.
  AssertEqual(M.Sum(), 6.0);
}

template<typename Real>
static void UnitTestRowMax() {
  Matrix<Real> M(2, 4);
  M(0, 2) = 0.7;
  M(0, 3) = 0.7;
  M(1, 0) = -0.5;
  M(1, 1) = -0.25;
  M(1, 2) = -1.0;
  M(1, 3) = -2.0;
  MatrixIndexT col;
  AssertEqual(M.RowMax(0, &col), 0.7);
  SLOTCODEC_ASSERT(col == 2);  // ties go to the lowest column.
  AssertEqual(M.RowMax(1, &col), -0.25);
  SLOTCODEC_ASSERT(col == 1);
  Matrix<Real> E(2, 0);
  try {
    E.RowMax(0, &col);
    SLOTCODEC_ERR << "Expected an error for an empty row.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()) == "Empty matrix row");
  }
}

template<typename Real>
static void UnitTestIo() {
  Matrix<Real> M(3, 5);
  for (MatrixIndexT r = 0; r < M.NumRows(); r++)
    for (MatrixIndexT c = 0; c < M.NumCols(); c++)
      M(r, c) = (r * 5 + c) * 0.25;
  std::ostringstream os;
  M.Write(os);
  SLOTCODEC_ASSERT(os.str().substr(0, 4) == " [\n ");
  std::istringstream is(os.str());
  Matrix<Real> N;
  N.Read(is);
  SLOTCODEC_ASSERT(N.NumRows() == 3 && N.NumCols() == 5);
  SLOTCODEC_ASSERT(M.ApproxEqual(N, 0.0001));

  Matrix<Real> empty;
  std::ostringstream os2;
  empty.Write(os2);
  SLOTCODEC_ASSERT(os2.str() == " [ ]\n");
  std::istringstream is2(os2.str());
  N.Read(is2);
  SLOTCODEC_ASSERT(N.NumRows() == 0 && N.NumCols() == 0);

  // rows of unequal length are rejected.
  std::istringstream is3(" [\n  1 2 \n  3 ]\n");
  try {
    N.Read(is3);
    SLOTCODEC_ERR << "Expected a read error.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("columns")
                     != std::string::npos);
  }
}

template<typename Real>
static void CodecMatrixUnitTest() {
  UnitTestResize<Real>();
  UnitTestSetRowRange<Real>();
  UnitTestRowMax<Real>();
  UnitTestIo<Real>();
}

}  // namespace slotcodec

int main() {
  slotcodec::CodecMatrixUnitTest<float>();
  slotcodec::CodecMatrixUnitTest<double>();
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
